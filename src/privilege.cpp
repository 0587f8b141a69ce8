#include "volmap/privilege.h"
#include "volmap/error.h"
#include "internal.h"

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace volmap {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

/// Initial buffer size for the *_r NSS lookups; grown on ERANGE.
size_t nss_buffer_size() {
    long n = ::sysconf(_SC_GETGR_R_SIZE_MAX);
    return n > 0 ? static_cast<size_t>(n) : 4096;
}

/// Call a getXXX_r function, growing the buffer on ERANGE, and convert
/// the entry while its strings are still alive.
template <typename Entry, typename Lookup, typename Convert>
auto nss_lookup(Lookup&& lookup, Convert&& convert, const std::string& what)
    -> std::optional<decltype(convert(std::declval<const Entry&>()))> {
    std::vector<char> buf(nss_buffer_size());
    Entry entry;
    Entry* result = nullptr;
    while (true) {
        int rc = lookup(&entry, buf.data(), buf.size(), &result);
        if (rc == ERANGE) {
            buf.resize(buf.size() * 2);
            continue;
        }
        // Not found is 0 with a null result on glibc, an errno elsewhere
        if (rc == 0 || rc == ENOENT || rc == ESRCH ||
            rc == EBADF || rc == EPERM) {
            if (!result) return std::nullopt;
            return convert(*result);
        }
        errno = rc;
        throw IoError(sys::errno_message("lookup failed", what));
    }
}

GroupInfo to_group(const struct ::group& g) {
    return GroupInfo{g.gr_name, g.gr_gid};
}

UserInfo to_user(const struct ::passwd& p) {
    return UserInfo{p.pw_name, p.pw_uid, p.pw_gid};
}

/// Run @p argv and return its exit status.
int run_program(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) throw IoError(sys::errno_message("fork failed", argv[0]));
    if (pid == 0) {
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR)
            throw IoError(sys::errno_message("waitpid failed", argv[0]));
    }
    if (!WIFEXITED(wstatus)) return -1;
    return WEXITSTATUS(wstatus);
}

[[noreturn]] void throw_errno(const std::string& what,
                              const std::filesystem::path& path) {
    if (errno == EPERM || errno == EACCES) {
        throw PermissionError(sys::errno_message(what, path));
    }
    throw IoError(sys::errno_message(what, path));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SystemPrivilegeOps
// ---------------------------------------------------------------------------

SystemPrivilegeOps::SystemPrivilegeOps(std::string groupadd)
    : groupadd_(std::move(groupadd)) {}

std::optional<GroupInfo> SystemPrivilegeOps::find_group_by_gid(gid_t gid) const {
    return nss_lookup<struct ::group>(
        [gid](struct ::group* g, char* buf, size_t len, struct ::group** res) {
            return ::getgrgid_r(gid, g, buf, len, res);
        },
        to_group, "gid " + std::to_string(gid));
}

std::optional<GroupInfo>
SystemPrivilegeOps::find_group_by_name(const std::string& name) const {
    return nss_lookup<struct ::group>(
        [&name](struct ::group* g, char* buf, size_t len, struct ::group** res) {
            return ::getgrnam_r(name.c_str(), g, buf, len, res);
        },
        to_group, "group " + name);
}

std::optional<UserInfo> SystemPrivilegeOps::find_user(const std::string& name) const {
    return nss_lookup<struct ::passwd>(
        [&name](struct ::passwd* p, char* buf, size_t len, struct ::passwd** res) {
            return ::getpwnam_r(name.c_str(), p, buf, len, res);
        },
        to_user, "user " + name);
}

void SystemPrivilegeOps::create_group(const std::string& name, gid_t gid) {
    if (::geteuid() != 0) {
        throw PermissionError("creating group '" + name + "' requires root");
    }
    int rc = run_program({groupadd_, "-g", std::to_string(gid), name});
    switch (rc) {
        case 0:
            return;
        case 4: // gid not unique
        case 9: // name not unique
            throw GidConflictError(name, gid, groupadd_ + " refused a duplicate");
        case 127:
            throw IoError("cannot run " + groupadd_);
        default:
            throw IoError(groupadd_ + " exited with status " + std::to_string(rc));
    }
}

void SystemPrivilegeOps::set_group(const std::filesystem::path& path, gid_t gid) {
    if (::chown(path.c_str(), static_cast<uid_t>(-1), gid) != 0) {
        throw_errno("chgrp failed", path);
    }
}

void SystemPrivilegeOps::add_mode_bits(const std::filesystem::path& path,
                                       mode_t bits) {
    auto st = sys::stat_path(path);
    if (!st) {
        errno = ENOENT;
        throw_errno("chmod failed", path);
    }
    if (::chmod(path.c_str(), (st->st_mode & 07777) | bits) != 0) {
        throw_errno("chmod failed", path);
    }
}

void SystemPrivilegeOps::set_link_owner(const std::filesystem::path& link,
                                        uid_t uid, gid_t gid) {
    if (::lchown(link.c_str(), uid, gid) != 0) {
        throw_errno("lchown failed", link);
    }
}

} // namespace volmap
