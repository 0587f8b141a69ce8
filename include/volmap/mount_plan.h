#pragma once

/// @file mount_plan.h
/// Automatic bind mounts for files placed under a `mounted-files/` tree.
///
/// The tree mirrors the container filesystem: `mounted-files/root/.vimrc`
/// is mounted at `/root/.vimrc`.  Symlinks inside the tree become links
/// created in the container instead of mounts.

#include "types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace volmap {

/// Options for plan_mounts().
struct PlanOptions {
    /// Glob patterns matched against each entry's filename.
    std::vector<std::string> exclude = {".gitkeep"};
};

/// `rw` if the owner or group may write @p path, `ro` otherwise.
/// @throws IoError if @p path cannot be stat'ed.
MountMode mount_mode_for(const std::filesystem::path& path);

/// True if @p link is a relative symlink whose referent stays inside
/// @p base and exists.  The referent is checked both lexically and after
/// resolving symlinks, so a hop through an in-tree link to a directory
/// outside @p base is rejected.
bool validate_link(const std::filesystem::path& link,
                   const std::filesystem::path& base);

/// Walk @p mounted_files and build the mount plan.  A missing directory
/// gives an empty plan.  Entries whose container path (or link referent)
/// contains `:` cannot be written as a volume line or manifest entry and
/// are rejected with a warning.
MountPlan plan_mounts(const std::filesystem::path& mounted_files,
                      const PlanOptions& opts = {});

/// Compose `volumes:` list items, one `- host:container:mode` per mount.
std::vector<std::string> render_volume_lines(const MountPlan& plan);

/// Write a compose file that adds the planned mounts to @p service:
///
///     services:
///       <service>:
///         volumes:
///           - host:container:mode
///
/// @throws MissingParentDirectoryError if the parent directory is missing.
/// @throws IoError on write failure.
void write_compose_layer(const MountPlan& plan,
                         const std::filesystem::path& path,
                         const std::string& service);

/// Write the planned links as `source:target` lines.
/// @throws ConfigError if a path contains `:`.
/// @throws IoError on write failure.
void write_link_manifest(const MountPlan& plan,
                         const std::filesystem::path& path);

/// Read a manifest written by write_link_manifest().  A missing file
/// gives an empty list; blank lines and `#` comments are ignored.
/// @throws ConfigError for malformed lines.
/// @throws IoError if the file exists but cannot be read.
std::vector<SymlinkPair> read_link_manifest(const std::filesystem::path& path);

} // namespace volmap
