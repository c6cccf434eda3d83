/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_consumer.h
 * Description: Header for StreamConsumer, a partitioned-log style consumer backed
 *              by stream readers. Owns the per-topic reader registry, rebuilt on
 *              every subscribe, and the time-budgeted polling engine that drains
 *              all readers round-robin into one ConsumerRecords batch.
 */

#pragma once

#include "kbridge/client/client_config.h"
#include "kbridge/client/codec.h"
#include "kbridge/client/handle_registry.h"
#include "kbridge/client/stream_handle.h"
#include "kbridge/consumer/consumer_interceptor.h"
#include "kbridge/consumer/consumer_record.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace kbridge {
namespace consumer {

using OffsetCommitCallback = std::function<void(const std::map<TopicPartition, OffsetAndMetadata>& offsets,
                                                std::exception_ptr error)>;

// Not safe for concurrent poll/subscribe calls; only close() may be called
// from another thread while a poll is in progress.
class StreamConsumer {
public:
    // Budget used when poll is called with a zero timeout
    static constexpr int64_t DEFAULT_POLL_TIMEOUT_MS = 500;
    static constexpr int DEFAULT_RECORDS_PER_READER_PER_ROUND = 10;

    // Interceptors named in the config are resolved through the
    // InterceptorRegistry and run before the explicitly supplied ones.
    StreamConsumer(const client::ClientConfig& config,
                   std::shared_ptr<client::StreamClientFactory> factory,
                   std::vector<std::shared_ptr<ConsumerInterceptor>> interceptors = {});
    ~StreamConsumer();

    StreamConsumer(const StreamConsumer&) = delete;
    StreamConsumer& operator=(const StreamConsumer&) = delete;

    // Replace the whole subscription. Existing readers are closed and a new
    // reader is created for every topic, even one that was already subscribed.
    void subscribe(const std::vector<std::string>& topics);
    void subscribe_pattern(const std::regex& pattern);
    void unsubscribe();
    std::set<std::string> subscription() const;

    ConsumerRecords poll(std::chrono::milliseconds timeout);
    ConsumerRecords poll(int64_t timeout_ms);

    // Full polling engine: drain every reader round-robin until the deadline,
    // taking at most records_per_round from a reader per pass and at most
    // max_total_records overall, then run the interceptor chain.
    ConsumerRecords poll(int64_t timeout_ms, int records_per_round, int max_total_records);

    // The stream store tracks reader positions itself; commits always succeed.
    void commit_sync();
    void commit_sync(const std::map<TopicPartition, OffsetAndMetadata>& offsets);
    void commit_async();
    void commit_async(OffsetCommitCallback callback);
    void commit_async(const std::map<TopicPartition, OffsetAndMetadata>& offsets,
                      OffsetCommitCallback callback);

    std::set<TopicPartition> assignment() const;
    void assign(const std::vector<TopicPartition>& partitions);
    void seek(const TopicPartition& partition, int64_t offset);
    void seek_to_beginning(const std::vector<TopicPartition>& partitions);
    void seek_to_end(const std::vector<TopicPartition>& partitions);
    int64_t position(const TopicPartition& partition) const;
    OffsetAndMetadata committed(const TopicPartition& partition) const;
    std::set<TopicPartition> paused() const;
    void pause(const std::vector<TopicPartition>& partitions);
    void resume(const std::vector<TopicPartition>& partitions);
    std::map<TopicPartition, int64_t> offsets_for_times(const std::map<TopicPartition, int64_t>& timestamps);
    std::map<TopicPartition, int64_t> beginning_offsets(const std::vector<TopicPartition>& partitions);
    std::map<TopicPartition, int64_t> end_offsets(const std::vector<TopicPartition>& partitions);

    std::vector<PartitionInfo> partitions_for(const std::string& topic) const;
    std::map<std::string, std::vector<PartitionInfo>> list_topics() const;
    std::map<std::string, double> metrics() const;

    void wakeup();

    // Idempotent. Readers and interceptors are closed best-effort.
    void close();
    void close(std::chrono::milliseconds timeout);
    bool is_closed() const { return closed_.load(); }

    const std::string& scope() const { return scope_; }
    const std::string& reader_group_id() const { return reader_group_id_; }
    const std::string& reader_id() const { return reader_id_; }

private:
    std::shared_ptr<client::StreamClientFactory> factory_;
    std::string endpoints_;
    std::string scope_;
    std::string reader_group_id_;
    std::string reader_id_;
    std::chrono::milliseconds read_timeout_;
    int max_poll_records_;
    std::shared_ptr<client::EventCodec> deserializer_;
    ConsumerInterceptors interceptors_;
    client::HandleRegistry<client::StreamReader> readers_;
    std::atomic<bool> closed_{false};

    ConsumerRecords read(std::chrono::milliseconds timeout, int records_per_round, int max_total_records);
    bool translate(const std::string& stream, const std::string& payload, ConsumerRecord& record) const;
    void ensure_not_closed() const;
};

} // namespace consumer
} // namespace kbridge
