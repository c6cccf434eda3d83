/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: connect.cc
 * Description: Endpoint resolution for stream client factories.
 */

#include "kbridge/remote/connect.h"
#include "kbridge/client/errors.h"
#include "kbridge/remote/grpc_stream_client.h"
#include "kbridge/storage/local_stream_client.h"
#include <cstring>
#include <iostream>

namespace kbridge {
namespace remote {

std::shared_ptr<client::StreamClientFactory> connect(const std::string& endpoint) {
    if (endpoint.rfind(FILE_SCHEME, 0) == 0) {
        std::string directory = endpoint.substr(std::strlen(FILE_SCHEME));
        if (directory.empty()) {
            throw client::IllegalArgumentError("Missing directory in endpoint " + endpoint);
        }
        std::cout << "connect: using local stream store at " << directory << std::endl;
        return storage::LocalStreamClientFactory::open(directory);
    }

    // Several bootstrap servers may be listed; the first one is used
    std::string target = endpoint.substr(0, endpoint.find(','));
    if (target.empty()) {
        throw client::IllegalArgumentError("Empty stream store endpoint");
    }
    std::cout << "connect: using stream store daemon at " << target << std::endl;
    return std::make_shared<GrpcStreamClientFactory>(target);
}

std::shared_ptr<client::StreamClientFactory> connect(const client::ClientConfig& config) {
    return connect(config.server_endpoints());
}

} // namespace remote
} // namespace kbridge
