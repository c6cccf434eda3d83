/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_consumer.cc
 * Description: Implementation of StreamConsumer: reader registry management and
 *              the time-budgeted, round-robin polling engine.
 */

#include "kbridge/consumer/stream_consumer.h"
#include "kbridge/client/errors.h"
#include "kbridge/interceptors/interceptor_registry.h"
#include <iostream>
#include <utility>

namespace kbridge {
namespace consumer {

using client::IllegalArgumentError;
using client::IllegalStateError;
using client::UnsupportedOperationError;

StreamConsumer::StreamConsumer(const client::ClientConfig& config,
                               std::shared_ptr<client::StreamClientFactory> factory,
                               std::vector<std::shared_ptr<ConsumerInterceptor>> interceptors)
    : factory_(std::move(factory)),
      endpoints_(config.server_endpoints()),
      scope_(config.scope()),
      reader_group_id_(config.group_id()),
      reader_id_(config.client_id()),
      read_timeout_(config.read_timeout()),
      max_poll_records_(config.max_poll_records()),
      deserializer_(config.deserializer()) {
    if (!factory_) {
        throw IllegalArgumentError("StreamConsumer requires a stream client factory");
    }

    auto configured = interceptors::InterceptorRegistry::instance()
        .create_consumer_interceptors(config.interceptor_classes());
    for (auto& interceptor : configured) {
        interceptors_.add(std::move(interceptor));
    }
    for (auto& interceptor : interceptors) {
        interceptors_.add(std::move(interceptor));
    }

    std::cout << "StreamConsumer: created for scope " << scope_ << " at " << endpoints_
              << " (reader group " << reader_group_id_ << ", reader " << reader_id_ << ")" << std::endl;
}

StreamConsumer::~StreamConsumer() {
    close();
}

void StreamConsumer::subscribe(const std::vector<std::string>& topics) {
    ensure_not_closed();

    // Old readers are never reused: group naming depends on the topic set
    readers_.close_all("StreamConsumer");
    readers_.clear();

    client::HandleRegistry<client::StreamReader> fresh;
    const bool suffix = topics.size() > 1;
    try {
        for (size_t i = 0; i < topics.size(); ++i) {
            const std::string& topic = topics[i];
            if (fresh.contains(topic)) {
                continue;
            }
            std::string group = reader_group_id_;
            if (suffix) {
                group += "-" + std::to_string(i + 1);
            }
            fresh.insert(topic, factory_->create_reader(scope_, topic, group, reader_id_));
        }
    } catch (const std::exception& e) {
        std::cerr << "StreamConsumer: Failed to subscribe: " << e.what() << std::endl;
        fresh.close_all("StreamConsumer");
        throw;
    }

    readers_ = std::move(fresh);
}

void StreamConsumer::subscribe_pattern(const std::regex& /*pattern*/) {
    throw UnsupportedOperationError("Pattern subscription is not supported");
}

void StreamConsumer::unsubscribe() {
    subscribe(std::vector<std::string>{});
}

std::set<std::string> StreamConsumer::subscription() const {
    return readers_.destination_set();
}

ConsumerRecords StreamConsumer::poll(std::chrono::milliseconds timeout) {
    return poll(static_cast<int64_t>(timeout.count()));
}

ConsumerRecords StreamConsumer::poll(int64_t timeout_ms) {
    return poll(timeout_ms, DEFAULT_RECORDS_PER_READER_PER_ROUND, max_poll_records_);
}

ConsumerRecords StreamConsumer::poll(int64_t timeout_ms, int records_per_round, int max_total_records) {
    ensure_not_closed();
    if (timeout_ms < 0) {
        throw IllegalArgumentError("Specified timeout is a negative value");
    }
    if (records_per_round <= 0 || max_total_records <= 0) {
        throw IllegalArgumentError("Record limits must be positive");
    }
    if (readers_.empty()) {
        throw IllegalStateError("Consumer is not subscribed to any topics");
    }

    // A zero timeout still gets a bounded chance to make progress
    int64_t effective = timeout_ms == 0 ? DEFAULT_POLL_TIMEOUT_MS : timeout_ms;

    ConsumerRecords records = read(std::chrono::milliseconds(effective), records_per_round, max_total_records);
    return interceptors_.on_consume(records);
}

ConsumerRecords StreamConsumer::read(std::chrono::milliseconds timeout, int records_per_round,
                                     int max_total_records) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    ConsumerRecords batch;
    int total = 0;

    while (clock::now() < deadline && total < max_total_records) {
        for (const auto& entry : readers_) {
            ensure_not_closed();
            if (clock::now() >= deadline || total >= max_total_records) {
                break;
            }

            std::vector<ConsumerRecord> pending;
            int taken = 0;
            while (taken < records_per_round && total < max_total_records && clock::now() < deadline) {
                ensure_not_closed();
                // ReinitializationRequiredError aborts the whole poll
                client::EventRead event;
                try {
                    event = entry.handle->read_next_event(read_timeout_);
                } catch (const std::exception&) {
                    // A concurrent close fails the read on the closed reader
                    ensure_not_closed();
                    throw;
                }
                if (!event.event) {
                    break;
                }
                ensure_not_closed();

                ConsumerRecord record;
                if (translate(entry.destination, *event.event, record)) {
                    pending.push_back(std::move(record));
                    ++taken;
                    ++total;
                }
            }

            batch.append(TopicPartition{entry.destination, 0}, std::move(pending));
        }
    }

    return batch;
}

bool StreamConsumer::translate(const std::string& stream, const std::string& payload,
                               ConsumerRecord& record) const {
    client::DecodedEvent decoded;
    try {
        decoded = deserializer_->decode(payload);
    } catch (const std::exception& e) {
        std::cerr << "StreamConsumer: Skipping undecodable event on stream " << stream
                  << ": " << e.what() << std::endl;
        return false;
    }

    record.topic = stream;
    record.partition = 0;
    record.offset = 0;
    record.timestamp = NO_TIMESTAMP;
    record.timestamp_type = TimestampType::NO_TIMESTAMP_TYPE;
    record.serialized_key_size = NULL_SIZE;
    record.serialized_value_size = NULL_SIZE;
    record.key = std::move(decoded.key);
    record.value = std::move(decoded.value);
    record.headers = std::move(decoded.headers);
    return true;
}

void StreamConsumer::commit_sync() {
    commit_sync(std::map<TopicPartition, OffsetAndMetadata>{});
}

void StreamConsumer::commit_sync(const std::map<TopicPartition, OffsetAndMetadata>& offsets) {
    ensure_not_closed();
    interceptors_.on_commit(offsets);
}

void StreamConsumer::commit_async() {
    commit_async(std::map<TopicPartition, OffsetAndMetadata>{}, nullptr);
}

void StreamConsumer::commit_async(OffsetCommitCallback callback) {
    commit_async(std::map<TopicPartition, OffsetAndMetadata>{}, std::move(callback));
}

void StreamConsumer::commit_async(const std::map<TopicPartition, OffsetAndMetadata>& offsets,
                                  OffsetCommitCallback callback) {
    ensure_not_closed();
    interceptors_.on_commit(offsets);
    if (callback) {
        callback(std::map<TopicPartition, OffsetAndMetadata>{}, nullptr);
    }
}

std::set<TopicPartition> StreamConsumer::assignment() const {
    return {};
}

void StreamConsumer::assign(const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("Manual partition assignment is not supported");
}

void StreamConsumer::seek(const TopicPartition& /*partition*/, int64_t /*offset*/) {
    throw UnsupportedOperationError("seek is not supported");
}

void StreamConsumer::seek_to_beginning(const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("seek_to_beginning is not supported");
}

void StreamConsumer::seek_to_end(const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("seek_to_end is not supported");
}

int64_t StreamConsumer::position(const TopicPartition& /*partition*/) const {
    return -1;
}

OffsetAndMetadata StreamConsumer::committed(const TopicPartition& /*partition*/) const {
    throw UnsupportedOperationError("committed is not supported");
}

std::set<TopicPartition> StreamConsumer::paused() const {
    throw UnsupportedOperationError("paused is not supported");
}

void StreamConsumer::pause(const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("pause is not supported");
}

void StreamConsumer::resume(const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("resume is not supported");
}

std::map<TopicPartition, int64_t> StreamConsumer::offsets_for_times(
    const std::map<TopicPartition, int64_t>& /*timestamps*/) {
    throw UnsupportedOperationError("offsets_for_times is not supported");
}

std::map<TopicPartition, int64_t> StreamConsumer::beginning_offsets(
    const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("beginning_offsets is not supported");
}

std::map<TopicPartition, int64_t> StreamConsumer::end_offsets(
    const std::vector<TopicPartition>& /*partitions*/) {
    throw UnsupportedOperationError("end_offsets is not supported");
}

std::vector<PartitionInfo> StreamConsumer::partitions_for(const std::string& topic) const {
    return {PartitionInfo{topic, 0}};
}

std::map<std::string, std::vector<PartitionInfo>> StreamConsumer::list_topics() const {
    std::map<std::string, std::vector<PartitionInfo>> result;
    for (const auto& entry : readers_) {
        result[entry.destination] = partitions_for(entry.destination);
    }
    return result;
}

std::map<std::string, double> StreamConsumer::metrics() const {
    return {};
}

void StreamConsumer::wakeup() {
}

void StreamConsumer::close() {
    if (closed_.exchange(true)) {
        return;
    }
    readers_.close_all("StreamConsumer");
    interceptors_.close();
    std::cout << "StreamConsumer: closed (reader group " << reader_group_id_ << ")" << std::endl;
}

void StreamConsumer::close(std::chrono::milliseconds /*timeout*/) {
    close();
}

void StreamConsumer::ensure_not_closed() const {
    if (closed_.load()) {
        throw IllegalStateError("This consumer has already been closed");
    }
}

} // namespace consumer
} // namespace kbridge
