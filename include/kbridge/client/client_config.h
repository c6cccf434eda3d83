/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: client_config.h
 * Description: Header for ClientConfig, the property bag handed to a consumer or
 *              producer. Keeps the emulated API's property names and exposes typed
 *              accessors with the bridge defaults (scope, identities, read timeout,
 *              poll limits, interceptors, serializers).
 */

#pragma once

#include "kbridge/client/codec.h"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kbridge {
namespace client {

class ClientConfig {
public:
    static constexpr const char* CONTROLLER_URI = "stream.controller.uri";
    static constexpr const char* BOOTSTRAP_SERVERS = "bootstrap.servers";
    static constexpr const char* SCOPE = "stream.scope";
    static constexpr const char* GROUP_ID = "group.id";
    static constexpr const char* CLIENT_ID = "client.id";
    static constexpr const char* READ_TIMEOUT_MS = "stream.read.timeout.ms";
    static constexpr const char* MAX_POLL_RECORDS = "max.poll.records";
    static constexpr const char* INTERCEPTOR_CLASSES = "interceptor.classes";
    static constexpr const char* VALUE_SERIALIZER = "value.serializer";
    static constexpr const char* VALUE_DESERIALIZER = "value.deserializer";

    static constexpr const char* DEFAULT_SCOPE = "migrated-from-kafka";
    static constexpr const char* DEFAULT_CLIENT_ID = "default_readerId";
    static constexpr int64_t DEFAULT_READ_TIMEOUT_MS = 100;
    static constexpr int DEFAULT_MAX_POLL_RECORDS = 500;

    ClientConfig() = default;
    explicit ClientConfig(std::map<std::string, std::string> properties);

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& default_value) const;
    bool contains(const std::string& key) const;
    const std::map<std::string, std::string>& properties() const { return properties_; }

    // Controller URI, else bootstrap servers. Throws IllegalArgumentError if
    // neither is set and default_value is blank.
    std::string server_endpoints(const std::string& default_value = "") const;

    std::string scope() const;

    // Configured group id, or a freshly generated unique id on every call
    std::string group_id() const;

    std::string client_id() const;

    // Per-event read sub-timeout
    std::chrono::milliseconds read_timeout() const;

    int max_poll_records() const;

    // Interceptor names in registration order
    std::vector<std::string> interceptor_classes() const;

    std::shared_ptr<EventCodec> serializer() const;
    std::shared_ptr<EventCodec> deserializer() const;

private:
    std::map<std::string, std::string> properties_;

    int64_t get_positive_int(const std::string& key, int64_t default_value) const;
};

// Random identifier in 8-4-4-4-12 hex layout
std::string generate_unique_id();

} // namespace client
} // namespace kbridge
