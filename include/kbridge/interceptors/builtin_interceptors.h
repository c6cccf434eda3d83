/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: builtin_interceptors.h
 * Description: Interceptors shipped with kbridge. The logging interceptors report
 *              batch sizes and failed sends; the counting interceptors keep
 *              running totals that applications can read back.
 */

#pragma once

#include "kbridge/consumer/consumer_interceptor.h"
#include "kbridge/producer/producer_interceptor.h"
#include <atomic>
#include <cstdint>
#include <string>

namespace kbridge {
namespace interceptors {

class LoggingConsumerInterceptor : public consumer::ConsumerInterceptor {
public:
    std::string name() const override { return "logging"; }
    consumer::ConsumerRecords on_consume(const consumer::ConsumerRecords& records) override;
};

class LoggingProducerInterceptor : public producer::ProducerInterceptor {
public:
    std::string name() const override { return "logging"; }
    producer::ProducerRecord on_send(const producer::ProducerRecord& record) override;
    void on_acknowledgement(const std::optional<producer::RecordMetadata>& metadata,
                            std::exception_ptr error) override;
};

class CountingConsumerInterceptor : public consumer::ConsumerInterceptor {
public:
    std::string name() const override { return "counting"; }
    consumer::ConsumerRecords on_consume(const consumer::ConsumerRecords& records) override;

    uint64_t batches() const { return batches_.load(); }
    uint64_t records() const { return records_.load(); }

private:
    std::atomic<uint64_t> batches_{0};
    std::atomic<uint64_t> records_{0};
};

class CountingProducerInterceptor : public producer::ProducerInterceptor {
public:
    std::string name() const override { return "counting"; }
    producer::ProducerRecord on_send(const producer::ProducerRecord& record) override;
    void on_acknowledgement(const std::optional<producer::RecordMetadata>& metadata,
                            std::exception_ptr error) override;

    uint64_t sent() const { return sent_.load(); }
    uint64_t acknowledged() const { return acknowledged_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> acknowledged_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace interceptors
} // namespace kbridge
