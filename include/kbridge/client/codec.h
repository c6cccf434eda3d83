/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: codec.h
 * Description: Value codecs translating between emulated-API records (key, value,
 *              headers) and the opaque event payload stored in a stream. The
 *              string codec stores the value only; the envelope codec wraps the
 *              whole record in an EventEnvelope protobuf message.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kbridge {
namespace client {

using Headers = std::map<std::string, std::string>;

struct DecodedEvent {
    std::optional<std::string> key;
    std::string value;
    Headers headers;
};

class EventCodec {
public:
    virtual ~EventCodec() = default;

    virtual std::string name() const = 0;

    virtual std::string encode(const std::optional<std::string>& key,
                               const std::string& value,
                               const Headers& headers) const = 0;

    virtual DecodedEvent decode(const std::string& payload) const = 0;
};

// Payload is the value; key and headers are not carried
class StringCodec : public EventCodec {
public:
    std::string name() const override { return "string"; }
    std::string encode(const std::optional<std::string>& key,
                       const std::string& value,
                       const Headers& headers) const override;
    DecodedEvent decode(const std::string& payload) const override;
};

// Payload is a serialized EventEnvelope
class EnvelopeCodec : public EventCodec {
public:
    std::string name() const override { return "envelope"; }
    std::string encode(const std::optional<std::string>& key,
                       const std::string& value,
                       const Headers& headers) const override;
    DecodedEvent decode(const std::string& payload) const override;
};

// Resolve a codec by configured name. Empty name selects the string codec.
// Accepts the emulated API's String(De)Serializer class names as aliases.
// Throws IllegalStateError for unknown names.
std::shared_ptr<EventCodec> make_codec(const std::string& name);

} // namespace client
} // namespace kbridge
