/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_producer.h
 * Description: Header for StreamProducer, a partitioned-log style producer backed
 *              by stream writers. Caches one writer per topic and adapts the
 *              writer's future-based append into the emulated send contract
 *              (future of optional metadata plus a one-shot callback).
 */

#pragma once

#include "kbridge/client/client_config.h"
#include "kbridge/client/codec.h"
#include "kbridge/client/handle_registry.h"
#include "kbridge/client/stream_handle.h"
#include "kbridge/consumer/consumer_record.h"
#include "kbridge/producer/producer_interceptor.h"
#include "kbridge/producer/producer_record.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kbridge {
namespace producer {

using SendFuture = std::future<std::optional<RecordMetadata>>;

class StreamProducer {
public:
    // Interceptors named in the config are resolved through the
    // InterceptorRegistry and run before the explicitly supplied ones.
    StreamProducer(const client::ClientConfig& config,
                   std::shared_ptr<client::StreamClientFactory> factory,
                   std::vector<std::shared_ptr<ProducerInterceptor>> interceptors = {});
    ~StreamProducer();

    StreamProducer(const StreamProducer&) = delete;
    StreamProducer& operator=(const StreamProducer&) = delete;

    // Never blocks on the write. A failed write resolves the future with an
    // empty optional; the callback receives a SendError wrapping the cause.
    SendFuture send(const ProducerRecord& record, SendCallback callback = nullptr);

    // Flush every writer, then wait for all earlier sends to complete
    void flush();

    std::vector<consumer::PartitionInfo> partitions_for(const std::string& topic) const;
    std::map<std::string, double> metrics() const;

    void init_transactions();
    void begin_transaction();
    void send_offsets_to_transaction(const std::map<consumer::TopicPartition, consumer::OffsetAndMetadata>& offsets,
                                     const std::string& group_id);
    void commit_transaction();
    void abort_transaction();

    // Idempotent
    void close();
    void close(std::chrono::milliseconds timeout);
    bool is_closed() const { return closed_.load(); }

    const std::string& scope() const { return scope_; }

private:
    struct PendingRecord {
        std::string topic;
        int32_t key_size = 0;
        int32_t value_size = 0;
        std::future<void> write;
        std::promise<std::optional<RecordMetadata>> promise;
        SendCallback callback;
    };

    std::shared_ptr<client::StreamClientFactory> factory_;
    std::string endpoints_;
    std::string scope_;
    std::shared_ptr<client::EventCodec> serializer_;
    ProducerInterceptors interceptors_;

    std::mutex writers_mutex_;
    client::HandleRegistry<client::StreamWriter> writers_;
    bool writers_closed_ = false;

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::condition_variable settled_cv_;
    std::deque<PendingRecord> pending_;
    uint64_t enqueued_ = 0;
    uint64_t settled_ = 0;
    bool stopping_ = false;
    std::thread completion_thread_;

    std::atomic<bool> closed_{false};

    client::StreamWriter& writer_for(const std::string& topic);
    void run_completions();
    void complete(PendingRecord& pending);
    void wait_for_settled(uint64_t target);
    void ensure_not_closed() const;
};

} // namespace producer
} // namespace kbridge
