/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: interceptor_registry.cc
 * Description: Implementation of the name-to-factory interceptor registry.
 */

#include "kbridge/interceptors/interceptor_registry.h"
#include "kbridge/interceptors/builtin_interceptors.h"
#include "kbridge/client/errors.h"
#include <utility>

namespace kbridge {
namespace interceptors {

InterceptorRegistry& InterceptorRegistry::instance() {
    static InterceptorRegistry* registry = []() {
        auto* r = new InterceptorRegistry();
        register_builtin_interceptors(*r);
        return r;
    }();
    return *registry;
}

void InterceptorRegistry::register_consumer(const std::string& name, ConsumerFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    consumer_factories_[name] = std::move(factory);
}

void InterceptorRegistry::register_producer(const std::string& name, ProducerFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    producer_factories_[name] = std::move(factory);
}

bool InterceptorRegistry::has_consumer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumer_factories_.count(name) > 0;
}

bool InterceptorRegistry::has_producer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producer_factories_.count(name) > 0;
}

std::vector<std::shared_ptr<consumer::ConsumerInterceptor>>
InterceptorRegistry::create_consumer_interceptors(const std::vector<std::string>& names) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<consumer::ConsumerInterceptor>> result;
    for (const auto& name : names) {
        auto it = consumer_factories_.find(name);
        if (it == consumer_factories_.end()) {
            throw client::IllegalArgumentError("Unknown consumer interceptor: " + name);
        }
        result.push_back(it->second());
    }
    return result;
}

std::vector<std::shared_ptr<producer::ProducerInterceptor>>
InterceptorRegistry::create_producer_interceptors(const std::vector<std::string>& names) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<producer::ProducerInterceptor>> result;
    for (const auto& name : names) {
        auto it = producer_factories_.find(name);
        if (it == producer_factories_.end()) {
            throw client::IllegalArgumentError("Unknown producer interceptor: " + name);
        }
        result.push_back(it->second());
    }
    return result;
}

void register_builtin_interceptors(InterceptorRegistry& registry) {
    registry.register_consumer("logging", []() {
        return std::make_shared<LoggingConsumerInterceptor>();
    });
    registry.register_consumer("counting", []() {
        return std::make_shared<CountingConsumerInterceptor>();
    });
    registry.register_producer("logging", []() {
        return std::make_shared<LoggingProducerInterceptor>();
    });
    registry.register_producer("counting", []() {
        return std::make_shared<CountingProducerInterceptor>();
    });
}

} // namespace interceptors
} // namespace kbridge
