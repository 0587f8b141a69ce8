#pragma once
/// Internal helpers shared between volmap source files.
/// Not part of the public API.

#include "volmap/error.h"
#include "volmap/types.h"

#include <sys/stat.h>

#include <filesystem>
#include <optional>
#include <string>

namespace volmap {

// ---------------------------------------------------------------------------
// sys: thin wrappers over stat(2) and errno
// ---------------------------------------------------------------------------

namespace sys {

/// "<what>: <path>: <strerror(errno)>"
std::string errno_message(const std::string& what,
                          const std::filesystem::path& path);

/// stat(2); nullopt when the path does not exist.
/// @throws IoError for any other failure.
std::optional<struct ::stat> stat_path(const std::filesystem::path& p);

/// lstat(2); nullopt when nothing (not even a dangling link) is there.
/// @throws IoError for any other failure.
std::optional<struct ::stat> lstat_path(const std::filesystem::path& p);

/// True if @p a was modified strictly after @p b (nanosecond resolution).
bool mtime_newer(const struct ::stat& a, const struct ::stat& b);

} // namespace sys

// ---------------------------------------------------------------------------
// paths: lexical path helpers
// ---------------------------------------------------------------------------

namespace paths {

/// True if lexically-normalized @p p is @p base or lies beneath it.
bool is_within(const std::filesystem::path& p,
               const std::filesystem::path& base);

/// "/" + @p rel with generic separators.
std::string container_path(const std::filesystem::path& rel);

} // namespace paths

// ---------------------------------------------------------------------------
// glob: filename pattern matching
// ---------------------------------------------------------------------------

namespace glob {

/// Match a single pattern segment against a name.
bool fnmatch(const std::string& pattern, const std::string& name);

} // namespace glob

} // namespace volmap
