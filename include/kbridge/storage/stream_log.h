/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_log.h
 * Description: Header for StreamLog, the segmented append-only storage behind the
 *              stream store. Keeps one directory of log/index segments per
 *              (scope, stream), provides append and read by position, and
 *              persists reader group positions.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "stream_event.pb.h"

namespace kbridge {
namespace storage {

struct SegmentInfo {
    std::string scope;
    std::string stream;
    int64_t base_position;
    std::string log_path;
    std::string idx_path;
    int64_t next_position;
    int64_t file_size;

    std::unique_ptr<std::ofstream> log_file;
    std::unique_ptr<std::ofstream> idx_file;

    // Write buffering
    std::vector<char> log_buffer;
    std::vector<char> idx_buffer;
    static constexpr size_t BUFFER_SIZE = 64 * 1024; // 64KB buffer
};

// Segmented per-stream log
class StreamLog {
public:
    struct Config {
        std::string base_dir = "stream_data";
        int64_t max_segment_size = 64 * 1024 * 1024; // 64MB
        bool use_buffering = true;
    };

    explicit StreamLog(const Config& config);
    ~StreamLog();

    StreamLog(const StreamLog&) = delete;
    StreamLog& operator=(const StreamLog&) = delete;

    // Returns false if the stream already exists
    bool create_stream(const std::string& scope, const std::string& stream);
    bool stream_exists(const std::string& scope, const std::string& stream);
    std::vector<std::string> list_streams(const std::string& scope);

    // Append a payload, returns its position. Throws StreamError if the stream does not exist.
    int64_t append(const std::string& scope, const std::string& stream,
                   const std::string& payload, const std::string& writer_id);

    // Read records starting at position
    std::vector<StreamRecord> read(const std::string& scope, const std::string& stream,
                                   int64_t position, int64_t max_records = 1000);

    // Position the next append will get
    int64_t end_position(const std::string& scope, const std::string& stream);

    // Reader group positions
    void commit_position(const std::string& scope, const std::string& group,
                         const std::string& stream, int64_t position);
    int64_t load_position(const std::string& scope, const std::string& group,
                          const std::string& stream);
    void clear_positions(const std::string& scope, const std::string& group);

    void flush_all_segments();

    const Config& config() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    // Active segment per "scope/stream"
    std::unordered_map<std::string, std::unique_ptr<SegmentInfo>> active_segments_;

    // Group positions: "scope/group" -> (stream -> position)
    std::unordered_map<std::string, std::map<std::string, int64_t>> group_positions_;

    static std::string key_for(const std::string& scope, const std::string& name);
    std::string stream_dir(const std::string& scope, const std::string& stream) const;
    std::string group_dir(const std::string& scope, const std::string& group) const;
    std::string segment_path(const std::string& scope, const std::string& stream,
                             int64_t base_position, const std::string& suffix) const;
    SegmentInfo* get_or_create_segment(const std::string& scope, const std::string& stream);
    void rotate_segment(const std::string& key);
    std::map<std::string, int64_t>& positions_for(const std::string& scope, const std::string& group);
    void validate_name(const std::string& kind, const std::string& name) const;

    void open_segment_files(SegmentInfo* seg);
    void flush_segment_buffers(SegmentInfo* seg);
    void close_segment_files(SegmentInfo* seg);
    std::vector<std::pair<int64_t, std::string>> get_segments_for_stream(const std::string& scope,
                                                                         const std::string& stream);
};

} // namespace storage
} // namespace kbridge
