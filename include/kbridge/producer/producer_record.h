/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: producer_record.h
 * Description: Types for the producer side: outbound ProducerRecord, the
 *              placeholder RecordMetadata reported on completion, the per-send
 *              callback signature and SendError, the uniform fault type handed
 *              to callbacks.
 */

#pragma once

#include "kbridge/client/codec.h"
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace kbridge {
namespace producer {

struct ProducerRecord {
    std::string topic;
    std::optional<int32_t> partition;
    std::optional<std::string> key;
    std::string value;
    client::Headers headers;
    std::optional<int64_t> timestamp;

    ProducerRecord() = default;
    ProducerRecord(std::string topic_name, std::string record_value)
        : topic(std::move(topic_name)), value(std::move(record_value)) {}
    ProducerRecord(std::string topic_name, std::string record_key, std::string record_value)
        : topic(std::move(topic_name)), key(std::move(record_key)), value(std::move(record_value)) {}
};

// The stream store reports no position on append, so partition and offset are
// always placeholders and timestamp is the completion time.
struct RecordMetadata {
    std::string topic;
    int32_t partition = -1;
    int64_t offset = -1;
    int64_t timestamp = 0;   // ms since epoch
    int32_t serialized_key_size = 0;
    int32_t serialized_value_size = 0;
};

// Generic fault passed to send callbacks; the underlying failure is kept as cause()
class SendError : public std::runtime_error {
public:
    SendError(const std::string& what, std::exception_ptr cause)
        : std::runtime_error(what), cause_(std::move(cause)) {}

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

// Invoked exactly once per send with metadata on success or a SendError on failure
using SendCallback = std::function<void(const std::optional<RecordMetadata>& metadata,
                                        std::exception_ptr error)>;

} // namespace producer
} // namespace kbridge
