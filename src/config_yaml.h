#pragma once
/// yaml-cpp conversions for configuration types.

#include "volmap/config.h"

#include <yaml-cpp/yaml.h>

#include <string>

namespace YAML {

/// A link is either `{source: ..., target: ...}` or a `source:target` scalar.
template <>
struct convert<volmap::SymlinkPair> {
    static Node encode(const volmap::SymlinkPair& rhs) {
        Node node;
        node["source"] = rhs.source.string();
        node["target"] = rhs.target.string();
        return node;
    }

    static bool decode(const Node& node, volmap::SymlinkPair& rhs) {
        if (node.IsScalar()) {
            rhs = volmap::parse_link(node.as<std::string>());
            return true;
        }
        if (!node.IsMap() || !node["source"] || !node["target"]) return false;
        rhs.source = node["source"].as<std::string>();
        rhs.target = node["target"].as<std::string>();
        return !rhs.source.empty() && !rhs.target.empty();
    }
};

} // namespace YAML
