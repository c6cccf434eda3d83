/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: client_config.cc
 * Description: Implementation of ClientConfig typed accessors and defaults, and
 *              of the unique identifier generator used for default group ids.
 */

#include "kbridge/client/client_config.h"
#include "kbridge/client/errors.h"
#include <cctype>
#include <cstdio>
#include <random>
#include <sstream>
#include <utility>

namespace kbridge {
namespace client {

namespace {

std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        start++;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        end--;
    }
    return value.substr(start, end - start);
}

} // namespace

ClientConfig::ClientConfig(std::map<std::string, std::string> properties)
    : properties_(std::move(properties)) {
}

void ClientConfig::set(const std::string& key, const std::string& value) {
    properties_[key] = value;
}

std::optional<std::string> ClientConfig::get(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ClientConfig::get_or(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value.has_value() ? *value : default_value;
}

bool ClientConfig::contains(const std::string& key) const {
    return properties_.count(key) > 0;
}

std::string ClientConfig::server_endpoints(const std::string& default_value) const {
    auto result = get(CONTROLLER_URI);
    if (!result.has_value()) {
        result = get(BOOTSTRAP_SERVERS);
    }
    if (result.has_value() && !trim(*result).empty()) {
        return trim(*result);
    }
    if (trim(default_value).empty()) {
        throw IllegalArgumentError(
            "Properties does not contain server endpoint(s), and default value is empty");
    }
    return default_value;
}

std::string ClientConfig::scope() const {
    return get_or(SCOPE, DEFAULT_SCOPE);
}

std::string ClientConfig::group_id() const {
    auto group = get(GROUP_ID);
    if (group.has_value() && !group->empty()) {
        return *group;
    }
    return generate_unique_id();
}

std::string ClientConfig::client_id() const {
    auto id = get(CLIENT_ID);
    if (id.has_value() && !id->empty()) {
        return *id;
    }
    return DEFAULT_CLIENT_ID;
}

int64_t ClientConfig::get_positive_int(const std::string& key, int64_t default_value) const {
    auto raw = get(key);
    if (!raw.has_value()) {
        return default_value;
    }
    const std::string text = trim(*raw);
    int64_t value = 0;
    size_t consumed = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::invalid_argument&) {
        throw IllegalArgumentError("Property " + key + " is not an integer: " + *raw);
    } catch (const std::out_of_range&) {
        throw IllegalArgumentError("Property " + key + " is out of range: " + *raw);
    }
    if (consumed != text.size()) {
        throw IllegalArgumentError("Property " + key + " is not an integer: " + *raw);
    }
    if (value <= 0) {
        throw IllegalArgumentError("Property " + key + " must be positive: " + *raw);
    }
    return value;
}

std::chrono::milliseconds ClientConfig::read_timeout() const {
    return std::chrono::milliseconds(get_positive_int(READ_TIMEOUT_MS, DEFAULT_READ_TIMEOUT_MS));
}

int ClientConfig::max_poll_records() const {
    return static_cast<int>(get_positive_int(MAX_POLL_RECORDS, DEFAULT_MAX_POLL_RECORDS));
}

std::vector<std::string> ClientConfig::interceptor_classes() const {
    std::vector<std::string> names;
    auto raw = get(INTERCEPTOR_CLASSES);
    if (!raw.has_value()) {
        return names;
    }
    std::istringstream iss(*raw);
    std::string token;
    while (std::getline(iss, token, ',')) {
        token = trim(token);
        if (!token.empty()) {
            names.push_back(token);
        }
    }
    return names;
}

std::shared_ptr<EventCodec> ClientConfig::serializer() const {
    return make_codec(get_or(VALUE_SERIALIZER, ""));
}

std::shared_ptr<EventCodec> ClientConfig::deserializer() const {
    return make_codec(get_or(VALUE_DESERIALIZER, ""));
}

std::string generate_unique_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace client
} // namespace kbridge
