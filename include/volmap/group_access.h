#pragma once

/// @file group_access.h
/// Group ownership fix-up for paths bind-mounted through a subordinate
/// GID mapping.

#include "privilege.h"
#include "types.h"

#include <filesystem>
#include <string>

namespace volmap {

/// The in-container GID that matches host GID @p host_subordinate_gid when
/// the runtime shifts container IDs by @p host_uid.
///
/// `container_gid(10227, 54556) == 44329`
///
/// @throws ConfigError if the result would be negative.
gid_t container_gid(uid_t host_uid, gid_t host_subordinate_gid);

/// Give group @p group_name (created at container_gid() if needed)
/// ownership of @p path and add g+rwx.  Owner and other bits are kept.
///
/// @return SkippedNoPath when @p path does not exist.
/// @throws GidConflictError if the gid or the name belongs to another group.
/// @throws PermissionError when not running with enough privilege.
GroupAccessResult fix_group_access(PrivilegeOps& ops,
                                   const std::filesystem::path& path,
                                   uid_t host_uid,
                                   gid_t host_subordinate_gid,
                                   const std::string& group_name);

} // namespace volmap
