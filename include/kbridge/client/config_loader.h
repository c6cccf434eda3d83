/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: config_loader.h
 * Description: Header for YAML client configuration loading. Nested mappings are
 *              flattened into dotted property names and sequences are joined with
 *              commas, producing the property bag a ClientConfig wraps.
 */

#pragma once

#include "kbridge/client/client_config.h"
#include <string>

namespace kbridge {
namespace client {

// Load client properties from a YAML file
ClientConfig load_client_config_from_yaml(const std::string& file_path);

// Same, from YAML text
ClientConfig load_client_config_from_yaml_string(const std::string& yaml);

} // namespace client
} // namespace kbridge
