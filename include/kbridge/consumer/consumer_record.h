/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: consumer_record.h
 * Description: Record types returned by StreamConsumer::poll. A ConsumerRecords
 *              batch groups translated records by (topic, partition); since the
 *              stream store has no partition/offset addressing, partition and
 *              offset are synthetic placeholders.
 */

#pragma once

#include "kbridge/client/codec.h"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace kbridge {
namespace consumer {

constexpr int64_t NO_TIMESTAMP = -1;
constexpr int32_t NULL_SIZE = -1;

struct TopicPartition {
    std::string topic;
    int32_t partition = 0;

    bool operator<(const TopicPartition& other) const {
        return std::tie(topic, partition) < std::tie(other.topic, other.partition);
    }
    bool operator==(const TopicPartition& other) const {
        return topic == other.topic && partition == other.partition;
    }
};

enum class TimestampType {
    NO_TIMESTAMP_TYPE,
    CREATE_TIME,
    LOG_APPEND_TIME
};

struct ConsumerRecord {
    std::string topic;
    int32_t partition = 0;
    int64_t offset = 0;
    int64_t timestamp = NO_TIMESTAMP;
    TimestampType timestamp_type = TimestampType::NO_TIMESTAMP_TYPE;
    int32_t serialized_key_size = NULL_SIZE;
    int32_t serialized_value_size = NULL_SIZE;
    std::optional<std::string> key;
    std::string value;
    client::Headers headers;
};

struct PartitionInfo {
    std::string topic;
    int32_t partition = 0;
};

struct OffsetAndMetadata {
    int64_t offset = 0;
    std::string metadata;
};

// Batch returned by one poll call
class ConsumerRecords {
public:
    using RecordMap = std::map<TopicPartition, std::vector<ConsumerRecord>>;

    ConsumerRecords() = default;
    explicit ConsumerRecords(RecordMap records) : records_(std::move(records)) {}

    // Append records to the partition entry, creating it on first contribution
    void append(const TopicPartition& tp, std::vector<ConsumerRecord> records);

    const std::vector<ConsumerRecord>& records(const TopicPartition& tp) const;

    // All records of one topic, partition by partition
    std::vector<ConsumerRecord> records(const std::string& topic) const;

    std::set<TopicPartition> partitions() const;

    size_t count() const;
    bool empty() const { return count() == 0; }

    const RecordMap& by_partition() const { return records_; }
    RecordMap& by_partition() { return records_; }

private:
    RecordMap records_;
};

} // namespace consumer
} // namespace kbridge
