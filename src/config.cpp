#include "volmap/config.h"
#include "volmap/error.h"
#include "config_yaml.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

extern char** environ;

namespace volmap {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Value parsers
// ---------------------------------------------------------------------------

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw ConfigError(key + ": expected a boolean, got '" + value + "'");
}

unsigned long parse_id(const std::string& key, const std::string& value) {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError(key + ": expected a non-negative integer, got '" +
                          value + "'");
    }
    unsigned long id = 0;
    try {
        id = std::stoul(value);
    } catch (const std::out_of_range&) {
        throw ConfigError(key + ": value out of range: " + value);
    }
    // uid_t / gid_t are 32-bit; (uid_t)-1 is reserved
    if (id >= std::numeric_limits<uint32_t>::max()) {
        throw ConfigError(key + ": value out of range: " + value);
    }
    return id;
}

ConflictPolicy parse_conflict_policy(const std::string& value) {
    if (value == "fail") return ConflictPolicy::Fail;
    if (value == "skip") return ConflictPolicy::Skip;
    throw ConfigError("conflict_policy: expected 'fail' or 'skip', got '" +
                      value + "'");
}

SymlinkPair parse_link(const std::string& value) {
    auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == value.size() ||
        value.find(':', colon + 1) != std::string::npos) {
        throw ConfigError("link must be 'source:target', got '" + value + "'");
    }
    return SymlinkPair{value.substr(0, colon), value.substr(colon + 1)};
}

std::vector<SymlinkPair> parse_link_list(const std::string& value) {
    std::vector<SymlinkPair> pairs;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (item.empty()) continue;
        pairs.push_back(parse_link(item));
    }
    return pairs;
}

// ---------------------------------------------------------------------------
// Derived paths
// ---------------------------------------------------------------------------

fs::path Config::template_file() const {
    if (template_path) return *template_path;
    return plugin_root / "templates" / "docker-compose.override.yml.template";
}

fs::path Config::override_file() const {
    if (override_path) return *override_path;
    return repo_root / "dev-environment" / "docker-compose.override.yml";
}

fs::path Config::mounted_files_dir() const {
    if (mounted_files) return *mounted_files;
    return plugin_root / "mounted-files";
}

fs::path Config::auto_mounts_file() const {
    if (auto_mounts_path) return *auto_mounts_path;
    return repo_root / "dev-environment" / "docker-compose.auto-mounts.yml";
}

// ---------------------------------------------------------------------------
// YAML
// ---------------------------------------------------------------------------

Config Config::from_yaml(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }

    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("top level must be a mapping");

    auto scalar = [&root](const char* key) -> std::optional<std::string> {
        auto node = root[key];
        if (!node || node.IsNull()) return std::nullopt;
        if (!node.IsScalar()) {
            throw ConfigError(std::string(key) + ": expected a scalar");
        }
        return node.as<std::string>();
    };

    if (auto v = scalar("plugin_root"))   cfg.plugin_root = *v;
    if (auto v = scalar("repo_root"))     cfg.repo_root = *v;
    if (auto v = scalar("template_path")) cfg.template_path = fs::path(*v);
    if (auto v = scalar("override_path")) cfg.override_path = fs::path(*v);
    if (auto v = scalar("custom_volumes"))
        cfg.custom_volumes = parse_bool("custom_volumes", *v);

    if (auto links = root["links"]) {
        if (!links.IsSequence()) throw ConfigError("links: expected a list");
        for (const auto& item : links) {
            try {
                cfg.links.push_back(item.as<SymlinkPair>());
            } catch (const YAML::Exception& e) {
                throw ConfigError(std::string("links: ") + e.what());
            }
        }
    }

    if (auto v = scalar("conflict_policy"))
        cfg.conflict_policy = parse_conflict_policy(*v);
    if (auto v = scalar("link_owner"))    cfg.link_owner = *v;
    if (auto v = scalar("required_user")) cfg.required_user = *v;

    if (auto v = scalar("host_uid"))
        cfg.host_uid = static_cast<uid_t>(parse_id("host_uid", *v));
    if (auto v = scalar("host_subordinate_gid"))
        cfg.host_subordinate_gid =
            static_cast<gid_t>(parse_id("host_subordinate_gid", *v));
    if (auto v = scalar("group_name"))  cfg.group_name = *v;
    if (auto v = scalar("shared_path")) cfg.shared_path = fs::path(*v);

    if (auto v = scalar("mounted_files")) cfg.mounted_files = fs::path(*v);
    if (auto v = scalar("auto_mounts_path")) cfg.auto_mounts_path = fs::path(*v);
    if (auto v = scalar("compose_service"))  cfg.compose_service = *v;
    if (auto v = scalar("link_manifest")) cfg.link_manifest = fs::path(*v);
    if (auto v = scalar("log_level"))     cfg.log_level = *v;

    return cfg;
}

Config Config::from_yaml_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError("cannot read " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return from_yaml(ss.str());
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------

void Config::apply_env(const EnvMap& env) {
    auto get = [&env](const char* name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };

    if (auto v = get("VOLMAP_PLUGIN_ROOT")) plugin_root = *v;
    if (auto v = get("VOLMAP_REPO_ROOT"))   repo_root = *v;
    if (auto v = get("VOLMAP_TEMPLATE"))    template_path = fs::path(*v);
    if (auto v = get("VOLMAP_OVERRIDE"))    override_path = fs::path(*v);
    if (auto v = get("VOLMAP_ENABLE_CUSTOM_VOLUMES"))
        custom_volumes = parse_bool("VOLMAP_ENABLE_CUSTOM_VOLUMES", *v);

    if (auto v = get("VOLMAP_LINKS")) links = parse_link_list(*v);
    if (auto v = get("VOLMAP_CONFLICT_POLICY"))
        conflict_policy = parse_conflict_policy(*v);
    if (auto v = get("VOLMAP_LINK_OWNER"))    link_owner = *v;
    if (auto v = get("VOLMAP_REQUIRED_USER")) required_user = *v;

    if (auto v = get("VOLMAP_HOST_UID"))
        host_uid = static_cast<uid_t>(parse_id("VOLMAP_HOST_UID", *v));
    if (auto v = get("VOLMAP_HOST_SUBORDINATE_GID"))
        host_subordinate_gid = static_cast<gid_t>(
            parse_id("VOLMAP_HOST_SUBORDINATE_GID", *v));
    if (auto v = get("VOLMAP_GROUP"))       group_name = *v;
    if (auto v = get("VOLMAP_SHARED_PATH")) shared_path = fs::path(*v);

    if (auto v = get("VOLMAP_MOUNTED_FILES")) mounted_files = fs::path(*v);
    if (auto v = get("VOLMAP_AUTO_MOUNTS"))   auto_mounts_path = fs::path(*v);
    if (auto v = get("VOLMAP_COMPOSE_SERVICE")) compose_service = *v;
    if (auto v = get("VOLMAP_LINK_MANIFEST")) link_manifest = fs::path(*v);
    if (auto v = get("VOLMAP_LOG_LEVEL"))     log_level = *v;
}

EnvMap process_env() {
    EnvMap env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return env;
}

} // namespace volmap
