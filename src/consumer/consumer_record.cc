/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: consumer_record.cc
 * Description: Implementation of the ConsumerRecords batch accessors.
 */

#include "kbridge/consumer/consumer_record.h"
#include <iterator>

namespace kbridge {
namespace consumer {

void ConsumerRecords::append(const TopicPartition& tp, std::vector<ConsumerRecord> records) {
    if (records.empty()) {
        return;
    }
    auto& entry = records_[tp];
    entry.insert(entry.end(),
                 std::make_move_iterator(records.begin()),
                 std::make_move_iterator(records.end()));
}

const std::vector<ConsumerRecord>& ConsumerRecords::records(const TopicPartition& tp) const {
    static const std::vector<ConsumerRecord> empty_records;
    auto it = records_.find(tp);
    return it != records_.end() ? it->second : empty_records;
}

std::vector<ConsumerRecord> ConsumerRecords::records(const std::string& topic) const {
    std::vector<ConsumerRecord> result;
    for (const auto& [tp, list] : records_) {
        if (tp.topic == topic) {
            result.insert(result.end(), list.begin(), list.end());
        }
    }
    return result;
}

std::set<TopicPartition> ConsumerRecords::partitions() const {
    std::set<TopicPartition> result;
    for (const auto& [tp, list] : records_) {
        if (!list.empty()) {
            result.insert(tp);
        }
    }
    return result;
}

size_t ConsumerRecords::count() const {
    size_t total = 0;
    for (const auto& [tp, list] : records_) {
        total += list.size();
    }
    return total;
}

} // namespace consumer
} // namespace kbridge
