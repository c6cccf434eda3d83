/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_handle.h
 * Description: Interfaces for the per-stream handles the consumer and producer
 *              drive: a blocking, timeout-bounded StreamReader, an asynchronous
 *              StreamWriter, and the StreamClientFactory that creates them for
 *              a given backing store (in-process or remote).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace kbridge {
namespace client {

// Result of one bounded read. An empty event means no data is available yet.
struct EventRead {
    std::optional<std::string> event;
    int64_t position = -1;
};

// Reader bound to one stream within a reader group
class StreamReader {
public:
    virtual ~StreamReader() = default;

    // Block up to timeout for the next event.
    // Throws ReinitializationRequiredError if the reader group was reset.
    virtual EventRead read_next_event(std::chrono::milliseconds timeout) = 0;

    // Release the reader. May throw; callers treat failures as best-effort.
    virtual void close() = 0;

    virtual const std::string& stream() const = 0;
    virtual const std::string& reader_group() const = 0;
};

// Writer bound to one stream
class StreamWriter {
public:
    virtual ~StreamWriter() = default;

    virtual void init() = 0;

    // Queue the payload for append. Write failures are delivered through the future.
    virtual std::future<void> write_event(const std::string& payload) = 0;

    // Block until every queued write has been handed to the store
    virtual void flush() = 0;

    virtual void close() = 0;

    virtual const std::string& stream() const = 0;
};

// Creates handles against one backing store
class StreamClientFactory {
public:
    virtual ~StreamClientFactory() = default;

    virtual std::unique_ptr<StreamReader> create_reader(const std::string& scope,
                                                        const std::string& stream,
                                                        const std::string& reader_group,
                                                        const std::string& reader_id) = 0;

    virtual std::unique_ptr<StreamWriter> create_writer(const std::string& scope,
                                                        const std::string& stream) = 0;
};

} // namespace client
} // namespace kbridge
