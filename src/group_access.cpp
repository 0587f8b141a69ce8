#include "volmap/group_access.h"
#include "volmap/error.h"
#include "volmap/log.h"
#include "internal.h"

#include <sys/stat.h>

#include <cstdint>

namespace volmap {

gid_t container_gid(uid_t host_uid, gid_t host_subordinate_gid) {
    int64_t gid = static_cast<int64_t>(host_subordinate_gid) -
                  static_cast<int64_t>(host_uid);
    if (gid < 0) {
        throw ConfigError("host subordinate gid " +
                          std::to_string(host_subordinate_gid) +
                          " is below host uid " + std::to_string(host_uid));
    }
    return static_cast<gid_t>(gid);
}

namespace {

/// Make sure @p name exists with @p gid, creating it when the gid is free.
void ensure_group(PrivilegeOps& ops, const std::string& name, gid_t gid) {
    auto logger = log::get();

    auto by_gid = ops.find_group_by_gid(gid);
    if (by_gid) {
        if (by_gid->name != name) {
            throw GidConflictError(name, gid,
                                   "already owned by group '" + by_gid->name + "'");
        }
        logger->info("Group {} already exists with GID {}", name, gid);
        return;
    }

    auto by_name = ops.find_group_by_name(name);
    if (by_name) {
        throw GidConflictError(name, gid,
                               "group exists with GID " +
                               std::to_string(by_name->gid));
    }

    logger->info("Creating group {} with GID {}", name, gid);
    ops.create_group(name, gid);
}

} // anonymous namespace

GroupAccessResult fix_group_access(PrivilegeOps& ops,
                                   const std::filesystem::path& path,
                                   uid_t host_uid,
                                   gid_t host_subordinate_gid,
                                   const std::string& group_name) {
    auto logger = log::get();

    if (!sys::stat_path(path)) {
        logger->info("Shared path not found: {} (skipping group fix)",
                     path.string());
        return GroupAccessResult::SkippedNoPath;
    }

    gid_t gid = container_gid(host_uid, host_subordinate_gid);
    ensure_group(ops, group_name, gid);

    ops.set_group(path, gid);
    ops.add_mode_bits(path, S_IRWXG);

    logger->info("{}: group {} (GID {}) with g+rwx",
                 path.string(), group_name, gid);
    return GroupAccessResult::Ok;
}

} // namespace volmap
