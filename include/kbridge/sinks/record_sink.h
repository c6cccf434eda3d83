/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: record_sink.h
 * Description: Base interface for consumed-record sinks, plus the conversion of
 *              a ConsumerRecord to its ConsumedRecord protobuf form shared by
 *              the JSON sinks.
 */

#pragma once

#include "kbridge/consumer/consumer_record.h"
#include "stream_event.pb.h"
#include <string>
#include <vector>

namespace kbridge {
namespace sinks {

class RecordSink {
public:
    virtual ~RecordSink() = default;

    virtual bool emit(const consumer::ConsumerRecord& record) = 0;

    virtual bool emit_batch(const consumer::ConsumerRecords& records) {
        bool all_ok = true;
        for (const auto& [partition, batch] : records.by_partition()) {
            for (const auto& record : batch) {
                if (!emit(record)) {
                    all_ok = false;
                }
            }
        }
        return all_ok;
    }

    virtual void flush() {}

    virtual void close() {}
};

ConsumedRecord to_consumed_record(const consumer::ConsumerRecord& record);

// Single-line JSON rendering of a consumed record. Returns false on failure.
bool to_json_line(const consumer::ConsumerRecord& record, std::string& json);

} // namespace sinks
} // namespace kbridge
