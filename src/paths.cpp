#include "internal.h"
#include "volmap/error.h"

#include <cerrno>
#include <cstring>
#include <string>

namespace volmap {

// ---------------------------------------------------------------------------
// sys
// ---------------------------------------------------------------------------

namespace sys {

std::string errno_message(const std::string& what,
                          const std::filesystem::path& path) {
    return what + ": " + path.string() + ": " + std::strerror(errno);
}

std::optional<struct ::stat> stat_path(const std::filesystem::path& p) {
    struct ::stat st;
    if (::stat(p.c_str(), &st) == 0) return st;
    if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
    throw IoError(errno_message("cannot stat", p));
}

std::optional<struct ::stat> lstat_path(const std::filesystem::path& p) {
    struct ::stat st;
    if (::lstat(p.c_str(), &st) == 0) return st;
    if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
    throw IoError(errno_message("cannot lstat", p));
}

bool mtime_newer(const struct ::stat& a, const struct ::stat& b) {
    if (a.st_mtim.tv_sec != b.st_mtim.tv_sec)
        return a.st_mtim.tv_sec > b.st_mtim.tv_sec;
    return a.st_mtim.tv_nsec > b.st_mtim.tv_nsec;
}

} // namespace sys

// ---------------------------------------------------------------------------
// paths
// ---------------------------------------------------------------------------

namespace paths {

/// Compares normalized components, so "/a/bc" is not within "/a/b".
bool is_within(const std::filesystem::path& p,
               const std::filesystem::path& base) {
    auto np = p.lexically_normal();
    auto nb = base.lexically_normal();

    auto pit = np.begin();
    for (auto bit = nb.begin(); bit != nb.end(); ++bit) {
        // A trailing separator normalizes to an empty last component
        if (bit->empty()) continue;
        if (pit == np.end() || *pit != *bit) return false;
        ++pit;
    }
    return true;
}

std::string container_path(const std::filesystem::path& rel) {
    return "/" + rel.lexically_normal().generic_string();
}

} // namespace paths

} // namespace volmap
