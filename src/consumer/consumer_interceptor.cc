/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: consumer_interceptor.cc
 * Description: Implementation of the consumer interceptor chain. Each stage runs
 *              inside its own try block so one interceptor's failure never affects
 *              the others or the poll that triggered it.
 */

#include "kbridge/consumer/consumer_interceptor.h"
#include <exception>
#include <iostream>
#include <utility>

namespace kbridge {
namespace consumer {

ConsumerInterceptors::ConsumerInterceptors(std::vector<std::shared_ptr<ConsumerInterceptor>> interceptors)
    : interceptors_(std::move(interceptors)) {
}

void ConsumerInterceptors::add(std::shared_ptr<ConsumerInterceptor> interceptor) {
    if (interceptor) {
        interceptors_.push_back(std::move(interceptor));
    }
}

ConsumerRecords ConsumerInterceptors::on_consume(const ConsumerRecords& records) const {
    ConsumerRecords processed = records;
    for (const auto& interceptor : interceptors_) {
        try {
            processed = interceptor->on_consume(processed);
        } catch (const std::exception& e) {
            std::cerr << "ConsumerInterceptors: Encountered exception executing interceptor "
                      << interceptor->name() << ": " << e.what() << std::endl;
        }
    }
    return processed;
}

void ConsumerInterceptors::on_commit(const std::map<TopicPartition, OffsetAndMetadata>& offsets) const {
    for (const auto& interceptor : interceptors_) {
        try {
            interceptor->on_commit(offsets);
        } catch (const std::exception& e) {
            std::cerr << "ConsumerInterceptors: on_commit failed in interceptor "
                      << interceptor->name() << ": " << e.what() << std::endl;
        }
    }
}

void ConsumerInterceptors::close() const {
    for (const auto& interceptor : interceptors_) {
        try {
            interceptor->close();
        } catch (const std::exception& e) {
            std::cerr << "ConsumerInterceptors: Failed to close interceptor "
                      << interceptor->name() << ": " << e.what() << std::endl;
        }
    }
}

} // namespace consumer
} // namespace kbridge
