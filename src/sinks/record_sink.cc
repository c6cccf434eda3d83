/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: record_sink.cc
 * Description: ConsumerRecord to ConsumedRecord conversion and JSON rendering.
 */

#include "kbridge/sinks/record_sink.h"
#include <google/protobuf/util/json_util.h>
#include <iostream>

namespace kbridge {
namespace sinks {

ConsumedRecord to_consumed_record(const consumer::ConsumerRecord& record) {
    ConsumedRecord out;
    out.set_topic(record.topic);
    out.set_partition(record.partition);
    out.set_offset(record.offset);
    out.set_timestamp(record.timestamp);
    if (record.key) {
        out.set_key(*record.key);
    }
    out.set_value(record.value);
    for (const auto& [name, value] : record.headers) {
        (*out.mutable_headers())[name] = value;
    }
    return out;
}

bool to_json_line(const consumer::ConsumerRecord& record, std::string& json) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    auto status = google::protobuf::util::MessageToJsonString(to_consumed_record(record), &json, options);
    if (!status.ok()) {
        std::cerr << "Failed to serialize record to JSON: " << status.message() << std::endl;
        return false;
    }
    return true;
}

} // namespace sinks
} // namespace kbridge
