#pragma once

/// @file cli.h
/// Command-line front end of the `volmap` tool.

#include "privilege.h"

#include <ostream>

namespace volmap {

/// Exit status for malformed command lines.
constexpr int EXIT_USAGE = 2;

/// Parse @p argv (`volmap [-c FILE] [-v] [-q] <command>`), run the command
/// and return the process exit status: 0 on success, 1 when the command
/// fails, EXIT_USAGE for usage errors.  Command output goes to @p out;
/// privileged steps of `container-startup` go through @p ops.
int run_cli(int argc, char* argv[], PrivilegeOps& ops, std::ostream& out);

} // namespace volmap
