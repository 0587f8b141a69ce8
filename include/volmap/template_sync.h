#pragma once

/// @file template_sync.h
/// Host-side sync of the compose override file from its template.

#include "types.h"

#include <filesystem>

namespace volmap {

/// Bring the generated override file up to date with its template.
///
/// The template is opaque bytes: it is copied verbatim, mode bits
/// included.  An override whose mtime is strictly newer than the
/// template's is treated as hand-edited and left untouched.
///
/// @param template_path  Source template.
/// @param override_path  Generated file; its parent directory must exist.
/// @param enabled        When false nothing on disk is examined.
/// @return What happened.
/// @throws MissingParentDirectoryError if the override's directory is absent.
/// @throws IoError if the copy itself fails.
SyncOutcome sync_template(const std::filesystem::path& template_path,
                          const std::filesystem::path& override_path,
                          bool enabled);

} // namespace volmap
