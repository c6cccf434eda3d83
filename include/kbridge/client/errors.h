/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: errors.h
 * Description: Exception types raised by the kbridge client. Separates usage
 *              errors (illegal argument/state, unsupported operation) from
 *              stream faults (reinitialization required, transport errors).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kbridge {
namespace client {

// Invalid caller input (negative timeout, empty topic, missing endpoint)
class IllegalArgumentError : public std::invalid_argument {
public:
    explicit IllegalArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// Operation not valid in the current state (closed instance, no subscription)
class IllegalStateError : public std::logic_error {
public:
    explicit IllegalStateError(const std::string& what) : std::logic_error(what) {}
};

// Emulated operation with no equivalent in the stream store
class UnsupportedOperationError : public std::logic_error {
public:
    explicit UnsupportedOperationError(const std::string& what) : std::logic_error(what) {}
};

// Failure talking to the stream store
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

// The reader's group state moved underneath it; the reader must be recreated.
// Never retried by the client, callers are expected to resubscribe.
class ReinitializationRequiredError : public StreamError {
public:
    explicit ReinitializationRequiredError(const std::string& what) : StreamError(what) {}
};

} // namespace client
} // namespace kbridge
