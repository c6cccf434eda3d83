/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_store.cc
 * Description: Implementation of StreamStore: blocking reads, reader group
 *              positions and generations over StreamLog.
 */

#include "kbridge/storage/stream_store.h"
#include "kbridge/client/errors.h"
#include <iostream>

namespace kbridge {
namespace storage {

StreamStore::StreamStore(const StreamLog::Config& config) {
    log_ = std::make_unique<StreamLog>(config);
}

bool StreamStore::create_stream(const std::string& scope, const std::string& stream) {
    bool created = log_->create_stream(scope, stream);
    if (created) {
        std::cout << "StreamStore: created stream " << scope << "/" << stream << std::endl;
    }
    return created;
}

bool StreamStore::stream_exists(const std::string& scope, const std::string& stream) {
    return log_->stream_exists(scope, stream);
}

std::vector<std::string> StreamStore::list_streams(const std::string& scope) {
    return log_->list_streams(scope);
}

int64_t StreamStore::append(const std::string& scope, const std::string& stream,
                            const std::string& payload, const std::string& writer_id) {
    int64_t position;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        position = log_->append(scope, stream, payload, writer_id);
    }
    appended_cv_.notify_all();
    return position;
}

int64_t StreamStore::generation_locked(const std::string& scope, const std::string& group) {
    return generations_[scope + "/" + group];
}

int64_t StreamStore::join_reader_group(const std::string& scope, const std::string& group,
                                       const std::string& /*reader_id*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_locked(scope, group);
}

std::optional<StreamRecord> StreamStore::read_next(const std::string& scope, const std::string& stream,
                                                   const std::string& group, int64_t generation,
                                                   std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (generation_locked(scope, group) != generation) {
            throw client::ReinitializationRequiredError(
                "Reader group " + group + " in scope " + scope + " was reset; reader must be recreated");
        }
        if (!log_->stream_exists(scope, stream)) {
            throw client::StreamError("Stream " + scope + "/" + stream + " does not exist");
        }

        int64_t position = log_->load_position(scope, group, stream);
        auto records = log_->read(scope, stream, position, 1);
        if (!records.empty()) {
            log_->commit_position(scope, group, stream, records.front().position() + 1);
            return records.front();
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        appended_cv_.wait_until(lock, deadline);
    }
}

int64_t StreamStore::reset_reader_group(const std::string& scope, const std::string& group) {
    int64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_->clear_positions(scope, group);
        generation = ++generations_[scope + "/" + group];
    }
    // Wake blocked readers so they observe the new generation
    appended_cv_.notify_all();
    std::cout << "StreamStore: reset reader group " << scope << "/" << group
              << " to generation " << generation << std::endl;
    return generation;
}

int64_t StreamStore::end_position(const std::string& scope, const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_->end_position(scope, stream);
}

int64_t StreamStore::group_position(const std::string& scope, const std::string& group,
                                    const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_->load_position(scope, group, stream);
}

void StreamStore::flush() {
    log_->flush_all_segments();
}

} // namespace storage
} // namespace kbridge
