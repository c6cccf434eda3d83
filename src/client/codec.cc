/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: codec.cc
 * Description: Implementation of the string and envelope event codecs and the
 *              name-based codec lookup used by client configuration.
 */

#include "kbridge/client/codec.h"
#include "kbridge/client/errors.h"
#include "stream_event.pb.h"
#include <iostream>

namespace kbridge {
namespace client {

std::string StringCodec::encode(const std::optional<std::string>& /*key*/,
                                const std::string& value,
                                const Headers& /*headers*/) const {
    return value;
}

DecodedEvent StringCodec::decode(const std::string& payload) const {
    DecodedEvent decoded;
    decoded.value = payload;
    return decoded;
}

std::string EnvelopeCodec::encode(const std::optional<std::string>& key,
                                  const std::string& value,
                                  const Headers& headers) const {
    EventEnvelope envelope;
    if (key.has_value()) {
        envelope.set_key(*key);
        envelope.set_has_key(true);
    }
    envelope.set_value(value);
    for (const auto& [name, header_value] : headers) {
        (*envelope.mutable_headers())[name] = header_value;
    }

    std::string payload;
    if (!envelope.SerializeToString(&payload)) {
        throw StreamError("EnvelopeCodec: failed to serialize event envelope");
    }
    return payload;
}

DecodedEvent EnvelopeCodec::decode(const std::string& payload) const {
    EventEnvelope envelope;
    if (!envelope.ParseFromString(payload)) {
        throw StreamError("EnvelopeCodec: payload is not an event envelope");
    }

    DecodedEvent decoded;
    if (envelope.has_key()) {
        decoded.key = envelope.key();
    }
    decoded.value = envelope.value();
    for (const auto& [name, header_value] : envelope.headers()) {
        decoded.headers[name] = header_value;
    }
    return decoded;
}

std::shared_ptr<EventCodec> make_codec(const std::string& name) {
    if (name.empty() || name == "string" ||
        name == "org.apache.kafka.common.serialization.StringSerializer" ||
        name == "org.apache.kafka.common.serialization.StringDeserializer") {
        return std::make_shared<StringCodec>();
    }
    if (name == "envelope") {
        return std::make_shared<EnvelopeCodec>();
    }
    std::cerr << "make_codec: Unable to resolve serializer with name [" << name << "]" << std::endl;
    throw IllegalStateError("Unknown serializer: " + name);
}

} // namespace client
} // namespace kbridge
