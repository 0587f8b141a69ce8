#pragma once

/// @file stages.h
/// The two lifecycle stages, wired from a Config.

#include "config.h"
#include "privilege.h"
#include "types.h"

#include <optional>
#include <vector>

namespace volmap {

/// What the pre-up stage did.
struct PreUpResult {
    SyncOutcome              outcome;
    std::optional<MountPlan> plan; ///< Set when the mounted-files tree was planned.
};

/// Host side: sync the override file, then (with custom volumes enabled
/// and a mounted-files directory present) plan auto-mounts, write them
/// as a compose layer and, when configured, write the link manifest for
/// the container stage.
///
/// @throws IoError (including MissingParentDirectoryError).
PreUpResult run_pre_up(const Config& cfg);

/// What the container-startup stage did.
struct StartupResult {
    bool                             links_ran = false; ///< False if the required user is missing.
    ReconcileReport                  report;
    std::vector<SymlinkPair>         unverified;
    std::optional<GroupAccessResult> group;             ///< Unset if not configured.
};

/// Container side: reconcile configured and manifest links, verify them,
/// then fix group access on the shared path when configured.
///
/// @throws SymlinkConflictError, PermissionError, GidConflictError,
///         IoError, ConfigError.
StartupResult run_container_startup(const Config& cfg, PrivilegeOps& ops);

} // namespace volmap
