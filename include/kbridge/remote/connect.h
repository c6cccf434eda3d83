/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: connect.h
 * Description: Resolves the configured server endpoint to a stream client
 *              factory: "file://<dir>" opens an in-process store, anything else
 *              is treated as the host:port of a kbridge_streamd daemon.
 */

#pragma once

#include "kbridge/client/client_config.h"
#include "kbridge/client/stream_handle.h"
#include <memory>
#include <string>

namespace kbridge {
namespace remote {

constexpr const char* FILE_SCHEME = "file://";

std::shared_ptr<client::StreamClientFactory> connect(const std::string& endpoint);

// Uses the config's controller URI, falling back to bootstrap servers
std::shared_ptr<client::StreamClientFactory> connect(const client::ClientConfig& config);

} // namespace remote
} // namespace kbridge
