/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: producer_interceptor.h
 * Description: Producer interceptor interface and the ordered, best-effort chain
 *              applied to every outbound record and completion. A failing
 *              interceptor is reported and skipped.
 */

#pragma once

#include "kbridge/producer/producer_record.h"
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kbridge {
namespace producer {

class ProducerInterceptor {
public:
    virtual ~ProducerInterceptor() = default;

    virtual std::string name() const = 0;

    // May rewrite the record. May throw.
    virtual ProducerRecord on_send(const ProducerRecord& record) = 0;

    virtual void on_acknowledgement(const std::optional<RecordMetadata>& /*metadata*/,
                                    std::exception_ptr /*error*/) {}

    virtual void close() {}
};

class ProducerInterceptors {
public:
    ProducerInterceptors() = default;
    explicit ProducerInterceptors(std::vector<std::shared_ptr<ProducerInterceptor>> interceptors);

    void add(std::shared_ptr<ProducerInterceptor> interceptor);

    ProducerRecord on_send(const ProducerRecord& record) const;

    void on_acknowledgement(const std::optional<RecordMetadata>& metadata,
                            std::exception_ptr error) const;

    void close() const;

    size_t size() const { return interceptors_.size(); }

private:
    std::vector<std::shared_ptr<ProducerInterceptor>> interceptors_;
};

} // namespace producer
} // namespace kbridge
