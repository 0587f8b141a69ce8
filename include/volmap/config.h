#pragma once

/// @file config.h
/// Explicit configuration shared by both lifecycle stages.

#include "types.h"

#include <sys/types.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace volmap {

/// Environment snapshot: variable name -> value.
using EnvMap = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

/// All inputs of the pre-up and container-startup stages.
///
/// Built from defaults, then an optional YAML file, then environment
/// variables (`VOLMAP_*`), then command-line flags.  Paths left unset are
/// derived from `plugin_root` / `repo_root` by the accessors below.
struct Config {
    std::filesystem::path plugin_root = ".";
    std::filesystem::path repo_root   = ".";

    std::optional<std::filesystem::path> template_path;
    std::optional<std::filesystem::path> override_path;
    bool custom_volumes = true;

    std::vector<SymlinkPair>   links;
    ConflictPolicy             conflict_policy = ConflictPolicy::Fail;
    std::optional<std::string> link_owner;
    std::optional<std::string> required_user;

    std::optional<uid_t>                 host_uid;
    std::optional<gid_t>                 host_subordinate_gid;
    std::string                          group_name = "user-credentials";
    std::optional<std::filesystem::path> shared_path;

    std::optional<std::filesystem::path> mounted_files;
    std::optional<std::filesystem::path> auto_mounts_path;
    std::string                          compose_service = "dev";
    std::optional<std::filesystem::path> link_manifest;

    std::string log_level = "info";

    // -- Derived paths ------------------------------------------------------

    std::filesystem::path template_file() const;
    std::filesystem::path override_file() const;
    std::filesystem::path mounted_files_dir() const;
    std::filesystem::path auto_mounts_file() const;

    /// True when everything fix_group_access() needs is configured.
    bool group_access_configured() const {
        return shared_path && host_uid && host_subordinate_gid;
    }

    // -- Loading ------------------------------------------------------------

    /// Parse a YAML document.  Unknown keys are ignored.
    /// @throws ConfigError on malformed YAML or values.
    static Config from_yaml(const std::string& text);

    /// Load a YAML file.
    /// @throws ConfigError if it cannot be read or parsed.
    static Config from_yaml_file(const std::filesystem::path& path);

    /// Overlay `VOLMAP_*` variables from @p env onto this config.
    /// @throws ConfigError on malformed values.
    void apply_env(const EnvMap& env);
};

/// Snapshot of the current process environment.
EnvMap process_env();

// ---------------------------------------------------------------------------
// Value parsers (shared by YAML, environment and manifest loading)
// ---------------------------------------------------------------------------

/// `true/false`, `yes/no`, `on/off`, `1/0` (case-insensitive).
bool parse_bool(const std::string& key, const std::string& value);

/// Non-negative decimal id.
unsigned long parse_id(const std::string& key, const std::string& value);

/// `fail` or `skip`.
ConflictPolicy parse_conflict_policy(const std::string& value);

/// One `source:target` pair; both sides must be non-empty.
SymlinkPair parse_link(const std::string& value);

/// Comma-separated `source:target` pairs; empty input gives no pairs.
std::vector<SymlinkPair> parse_link_list(const std::string& value);

} // namespace volmap
