/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_store.h
 * Description: Header for StreamStore, the stream storage facade used by local
 *              and remote clients. Adds blocking reads and reader groups on top
 *              of StreamLog. A reader group shares one position per stream
 *              between its readers and carries a generation that is bumped on
 *              reset, forcing joined readers to reinitialize.
 */

#pragma once

#include "kbridge/storage/stream_log.h"
#include "stream_event.pb.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kbridge {
namespace storage {

class StreamStore {
public:
    explicit StreamStore(const StreamLog::Config& config);

    // Returns false if the stream already exists
    bool create_stream(const std::string& scope, const std::string& stream);
    bool stream_exists(const std::string& scope, const std::string& stream);
    std::vector<std::string> list_streams(const std::string& scope);

    // Append and wake blocked readers. Returns the event position.
    int64_t append(const std::string& scope, const std::string& stream,
                   const std::string& payload, const std::string& writer_id = "");

    // Register a reader with its group, returns the group generation
    int64_t join_reader_group(const std::string& scope, const std::string& group,
                              const std::string& reader_id);

    // Next unread event of the group on this stream, or nullopt after timeout.
    // Throws ReinitializationRequiredError if generation is stale.
    std::optional<StreamRecord> read_next(const std::string& scope, const std::string& stream,
                                          const std::string& group, int64_t generation,
                                          std::chrono::milliseconds timeout);

    // Rewind the group to the start of every stream and bump its generation
    int64_t reset_reader_group(const std::string& scope, const std::string& group);

    int64_t end_position(const std::string& scope, const std::string& stream);
    int64_t group_position(const std::string& scope, const std::string& group, const std::string& stream);

    void flush();

private:
    std::unique_ptr<StreamLog> log_;
    std::mutex mutex_;
    std::condition_variable appended_cv_;

    // "scope/group" -> generation
    std::unordered_map<std::string, int64_t> generations_;

    int64_t generation_locked(const std::string& scope, const std::string& group);
};

} // namespace storage
} // namespace kbridge
