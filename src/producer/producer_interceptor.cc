/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: producer_interceptor.cc
 * Description: Implementation of the producer interceptor chain with per-stage
 *              failure isolation.
 */

#include "kbridge/producer/producer_interceptor.h"
#include <iostream>
#include <utility>

namespace kbridge {
namespace producer {

ProducerInterceptors::ProducerInterceptors(std::vector<std::shared_ptr<ProducerInterceptor>> interceptors)
    : interceptors_(std::move(interceptors)) {
}

void ProducerInterceptors::add(std::shared_ptr<ProducerInterceptor> interceptor) {
    if (interceptor) {
        interceptors_.push_back(std::move(interceptor));
    }
}

ProducerRecord ProducerInterceptors::on_send(const ProducerRecord& record) const {
    ProducerRecord intercepted = record;
    for (const auto& interceptor : interceptors_) {
        try {
            intercepted = interceptor->on_send(intercepted);
        } catch (const std::exception& e) {
            std::cerr << "ProducerInterceptors: Error executing interceptor "
                      << interceptor->name() << " on_send for topic " << record.topic
                      << ": " << e.what() << std::endl;
        }
    }
    return intercepted;
}

void ProducerInterceptors::on_acknowledgement(const std::optional<RecordMetadata>& metadata,
                                              std::exception_ptr error) const {
    for (const auto& interceptor : interceptors_) {
        try {
            interceptor->on_acknowledgement(metadata, error);
        } catch (const std::exception& e) {
            std::cerr << "ProducerInterceptors: Error executing interceptor "
                      << interceptor->name() << " on_acknowledgement: " << e.what() << std::endl;
        }
    }
}

void ProducerInterceptors::close() const {
    for (const auto& interceptor : interceptors_) {
        try {
            interceptor->close();
        } catch (const std::exception& e) {
            std::cerr << "ProducerInterceptors: Failed to close interceptor "
                      << interceptor->name() << ": " << e.what() << std::endl;
        }
    }
}

} // namespace producer
} // namespace kbridge
