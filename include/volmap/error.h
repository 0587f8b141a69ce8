#pragma once

#include <stdexcept>
#include <string>

namespace volmap {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all volmap exceptions.
class VolmapError : public std::runtime_error {
public:
    explicit VolmapError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// A filesystem I/O error occurred.
class IoError : public VolmapError {
public:
    explicit IoError(const std::string& msg)
        : VolmapError("io error: " + msg) {}
};

/// The directory that should contain a generated file does not exist.
/// Creating it belongs to whoever prepares the environment.
class MissingParentDirectoryError : public IoError {
public:
    explicit MissingParentDirectoryError(const std::string& path)
        : IoError("parent directory does not exist: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A link target exists as a regular file or directory.
class SymlinkConflictError : public VolmapError {
public:
    explicit SymlinkConflictError(const std::string& path)
        : VolmapError("target exists and is not a symlink: " + path),
          path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A privileged operation was refused (group creation, chgrp, chmod).
class PermissionError : public VolmapError {
public:
    explicit PermissionError(const std::string& msg)
        : VolmapError("permission denied: " + msg) {}
};

/// The GID a group needs is already taken by a different group, or the
/// group exists under a different GID.
class GidConflictError : public VolmapError {
public:
    GidConflictError(const std::string& group, unsigned long gid,
                     const std::string& detail)
        : VolmapError("gid conflict for group '" + group + "' (gid " +
                      std::to_string(gid) + "): " + detail),
          group_(group), gid_(gid) {}
    const std::string& group() const { return group_; }
    unsigned long gid() const { return gid_; }
private:
    std::string   group_;
    unsigned long gid_;
};

/// A configuration value is missing or malformed.
class ConfigError : public VolmapError {
public:
    explicit ConfigError(const std::string& msg)
        : VolmapError("config error: " + msg) {}
};

} // namespace volmap
