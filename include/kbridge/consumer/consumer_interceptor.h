/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: consumer_interceptor.h
 * Description: Consumer interceptor interface and the ordered, best-effort chain
 *              applied to every polled batch. A failing interceptor is reported
 *              and skipped; the chain continues with the last good batch.
 */

#pragma once

#include "kbridge/consumer/consumer_record.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kbridge {
namespace consumer {

class ConsumerInterceptor {
public:
    virtual ~ConsumerInterceptor() = default;

    virtual std::string name() const = 0;

    // Transform a polled batch. May throw.
    virtual ConsumerRecords on_consume(const ConsumerRecords& records) = 0;

    virtual void on_commit(const std::map<TopicPartition, OffsetAndMetadata>& /*offsets*/) {}

    virtual void close() {}
};

class ConsumerInterceptors {
public:
    ConsumerInterceptors() = default;
    explicit ConsumerInterceptors(std::vector<std::shared_ptr<ConsumerInterceptor>> interceptors);

    void add(std::shared_ptr<ConsumerInterceptor> interceptor);

    // Apply each interceptor in registration order
    ConsumerRecords on_consume(const ConsumerRecords& records) const;

    void on_commit(const std::map<TopicPartition, OffsetAndMetadata>& offsets) const;

    void close() const;

    size_t size() const { return interceptors_.size(); }

private:
    std::vector<std::shared_ptr<ConsumerInterceptor>> interceptors_;
};

} // namespace consumer
} // namespace kbridge
