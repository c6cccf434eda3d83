/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: interceptor_registry.h
 * Description: Header for InterceptorRegistry, which maps the interceptor names
 *              listed in "interceptor.classes" to factories. Applications register
 *              their own interceptors here; "logging" and "counting" are built in.
 */

#pragma once

#include "kbridge/consumer/consumer_interceptor.h"
#include "kbridge/producer/producer_interceptor.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kbridge {
namespace interceptors {

class InterceptorRegistry {
public:
    using ConsumerFactory = std::function<std::shared_ptr<consumer::ConsumerInterceptor>()>;
    using ProducerFactory = std::function<std::shared_ptr<producer::ProducerInterceptor>()>;

    InterceptorRegistry() = default;

    // Process-wide registry with the built-in interceptors registered
    static InterceptorRegistry& instance();

    // Replaces any factory registered under the same name
    void register_consumer(const std::string& name, ConsumerFactory factory);
    void register_producer(const std::string& name, ProducerFactory factory);

    bool has_consumer(const std::string& name) const;
    bool has_producer(const std::string& name) const;

    // Instantiate in the given order. Throws IllegalArgumentError for an unknown name.
    std::vector<std::shared_ptr<consumer::ConsumerInterceptor>>
    create_consumer_interceptors(const std::vector<std::string>& names) const;

    std::vector<std::shared_ptr<producer::ProducerInterceptor>>
    create_producer_interceptors(const std::vector<std::string>& names) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConsumerFactory> consumer_factories_;
    std::unordered_map<std::string, ProducerFactory> producer_factories_;
};

// Register "logging" and "counting" in the given registry
void register_builtin_interceptors(InterceptorRegistry& registry);

} // namespace interceptors
} // namespace kbridge
