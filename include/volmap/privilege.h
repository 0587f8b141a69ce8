#pragma once

/// @file privilege.h
/// Operations that need root inside the container.

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>

namespace volmap {

/// A group database entry.
struct GroupInfo {
    std::string name;
    gid_t       gid;
};

/// A user database entry.
struct UserInfo {
    std::string name;
    uid_t       uid;
    gid_t       gid;
};

// ---------------------------------------------------------------------------
// PrivilegeOps
// ---------------------------------------------------------------------------

/// Every call that touches the group database or file ownership goes
/// through this interface so reconcile logic can run without root.
///
/// Mutating calls throw PermissionError when the caller lacks privilege
/// and IoError for other failures.
class PrivilegeOps {
public:
    virtual ~PrivilegeOps() = default;

    virtual std::optional<GroupInfo> find_group_by_gid(gid_t gid) const = 0;
    virtual std::optional<GroupInfo> find_group_by_name(const std::string& name) const = 0;
    virtual std::optional<UserInfo>  find_user(const std::string& name) const = 0;

    /// Create group @p name with numeric id @p gid.
    virtual void create_group(const std::string& name, gid_t gid) = 0;

    /// Change the group of @p path (follows symlinks, like chgrp).
    virtual void set_group(const std::filesystem::path& path, gid_t gid) = 0;

    /// OR @p bits into the permission bits of @p path.
    virtual void add_mode_bits(const std::filesystem::path& path, mode_t bits) = 0;

    /// Change the owner of a symlink itself (lchown).
    virtual void set_link_owner(const std::filesystem::path& link,
                                uid_t uid, gid_t gid) = 0;
};

// ---------------------------------------------------------------------------
// SystemPrivilegeOps
// ---------------------------------------------------------------------------

/// The real thing: NSS lookups, `groupadd`, chown(2), chmod(2), lchown(2).
class SystemPrivilegeOps : public PrivilegeOps {
public:
    /// @param groupadd  Program used to create groups.
    explicit SystemPrivilegeOps(std::string groupadd = "groupadd");

    std::optional<GroupInfo> find_group_by_gid(gid_t gid) const override;
    std::optional<GroupInfo> find_group_by_name(const std::string& name) const override;
    std::optional<UserInfo>  find_user(const std::string& name) const override;

    void create_group(const std::string& name, gid_t gid) override;
    void set_group(const std::filesystem::path& path, gid_t gid) override;
    void add_mode_bits(const std::filesystem::path& path, mode_t bits) override;
    void set_link_owner(const std::filesystem::path& link,
                        uid_t uid, gid_t gid) override;

private:
    std::string groupadd_;
};

} // namespace volmap
