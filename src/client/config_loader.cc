/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: config_loader.cc
 * Description: Implementation of the YAML client configuration loader. Walks the
 *              document, flattening mappings ("stream: {scope: x}" becomes
 *              "stream.scope=x") and joining scalar sequences with commas.
 */

#include "kbridge/client/config_loader.h"
#include <yaml-cpp/yaml.h>
#include <map>
#include <stdexcept>

namespace kbridge {
namespace client {

namespace {

void flatten(const YAML::Node& node, const std::string& prefix,
             std::map<std::string, std::string>& out) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                std::string key = entry.first.as<std::string>();
                flatten(entry.second, prefix.empty() ? key : prefix + "." + key, out);
            }
            break;
        case YAML::NodeType::Sequence: {
            std::string joined;
            for (const auto& item : node) {
                if (!item.IsScalar()) {
                    throw std::runtime_error("Only scalar sequences are supported for key '" + prefix + "'");
                }
                if (!joined.empty()) {
                    joined += ",";
                }
                joined += item.as<std::string>();
            }
            out[prefix] = joined;
            break;
        }
        case YAML::NodeType::Scalar:
            out[prefix] = node.as<std::string>();
            break;
        case YAML::NodeType::Null:
            out[prefix] = "";
            break;
        case YAML::NodeType::Undefined:
            break;
    }
}

ClientConfig from_root(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw std::runtime_error("Client configuration must be a YAML mapping");
    }
    std::map<std::string, std::string> properties;
    flatten(root, "", properties);
    return ClientConfig(std::move(properties));
}

} // namespace

ClientConfig load_client_config_from_yaml(const std::string& file_path) {
    return from_root(YAML::LoadFile(file_path));
}

ClientConfig load_client_config_from_yaml_string(const std::string& yaml) {
    return from_root(YAML::Load(yaml));
}

} // namespace client
} // namespace kbridge
