/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_log.cc
 * Description: Implementation of the segmented stream log. Each stream lives in
 *              <base>/<scope>/streams/<stream>/ as length-prefixed StreamRecord
 *              segments with a 16-byte (position, file offset) index; reader
 *              group positions live in <base>/<scope>/groups/<group>/.
 */

#include "kbridge/storage/stream_log.h"
#include "kbridge/client/errors.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace kbridge {
namespace storage {

namespace {
    constexpr int64_t INDEX_ENTRY_SIZE = 16; // position (8) + file offset (8)

    int64_t now_ns() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

StreamLog::StreamLog(const Config& config) : config_(config) {
    fs::create_directories(config_.base_dir);
}

StreamLog::~StreamLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, seg] : active_segments_) {
        if (seg) {
            close_segment_files(seg.get());
        }
    }
}

std::string StreamLog::key_for(const std::string& scope, const std::string& name) {
    return scope + "/" + name;
}

void StreamLog::validate_name(const std::string& kind, const std::string& name) const {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw client::IllegalArgumentError("Invalid " + kind + " name: '" + name + "'");
    }
}

std::string StreamLog::stream_dir(const std::string& scope, const std::string& stream) const {
    return (fs::path(config_.base_dir) / scope / "streams" / stream).string();
}

std::string StreamLog::group_dir(const std::string& scope, const std::string& group) const {
    return (fs::path(config_.base_dir) / scope / "groups" / group).string();
}

std::string StreamLog::segment_path(const std::string& scope, const std::string& stream,
                                    int64_t base_position, const std::string& suffix) const {
    fs::path p(stream_dir(scope, stream));
    p /= ("segment_" + std::to_string(base_position) + suffix);
    return p.string();
}

bool StreamLog::create_stream(const std::string& scope, const std::string& stream) {
    validate_name("scope", scope);
    validate_name("stream", stream);
    std::lock_guard<std::mutex> lock(mutex_);
    return fs::create_directories(stream_dir(scope, stream));
}

bool StreamLog::stream_exists(const std::string& scope, const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fs::is_directory(stream_dir(scope, stream));
}

std::vector<std::string> StreamLog::list_streams(const std::string& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> streams;
    fs::path dir = fs::path(config_.base_dir) / scope / "streams";
    if (!fs::exists(dir)) {
        return streams;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) {
            streams.push_back(entry.path().filename().string());
        }
    }
    std::sort(streams.begin(), streams.end());
    return streams;
}

std::vector<std::pair<int64_t, std::string>> StreamLog::get_segments_for_stream(const std::string& scope,
                                                                                const std::string& stream) {
    std::vector<std::pair<int64_t, std::string>> segments;
    fs::path dir(stream_dir(scope, stream));
    if (!fs::exists(dir)) {
        return segments;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".log") {
            std::string stem = entry.path().stem().string();
            if (stem.find("segment_") == 0) {
                segments.emplace_back(std::stoll(stem.substr(8)), entry.path().string());
            }
        }
    }
    std::sort(segments.begin(), segments.end());
    return segments;
}

SegmentInfo* StreamLog::get_or_create_segment(const std::string& scope, const std::string& stream) {
    const std::string key = key_for(scope, stream);
    int64_t base_position = 0;
    int64_t next_position = 0;
    int64_t file_size = 0;

    auto it = active_segments_.find(key);
    if (it != active_segments_.end()) {
        if (it->second->file_size < config_.max_segment_size) {
            return it->second.get();
        }
        base_position = it->second->next_position;
        next_position = base_position;
        rotate_segment(key);
    } else {
        if (!fs::is_directory(stream_dir(scope, stream))) {
            throw client::StreamError("Stream " + key + " does not exist");
        }
        // Resume the newest segment on disk
        auto segments = get_segments_for_stream(scope, stream);
        if (!segments.empty()) {
            const auto& [last_base, last_log] = segments.back();
            std::string idx_path = last_log;
            idx_path.replace(idx_path.size() - 4, 4, ".idx");
            int64_t entries = 0;
            if (fs::exists(idx_path)) {
                entries = static_cast<int64_t>(fs::file_size(idx_path)) / INDEX_ENTRY_SIZE;
            }
            int64_t log_size = static_cast<int64_t>(fs::file_size(last_log));
            next_position = last_base + entries;
            if (log_size < config_.max_segment_size) {
                base_position = last_base;
                file_size = log_size;
            } else {
                base_position = next_position;
            }
        }
    }

    auto seg = std::make_unique<SegmentInfo>();
    seg->scope = scope;
    seg->stream = stream;
    seg->base_position = base_position;
    seg->log_path = segment_path(scope, stream, base_position, ".log");
    seg->idx_path = segment_path(scope, stream, base_position, ".idx");
    seg->next_position = next_position;
    seg->file_size = file_size;

    open_segment_files(seg.get());

    SegmentInfo* ptr = seg.get();
    active_segments_[key] = std::move(seg);
    return ptr;
}

void StreamLog::rotate_segment(const std::string& key) {
    auto it = active_segments_.find(key);
    if (it == active_segments_.end()) return;

    if (it->second) {
        close_segment_files(it->second.get());
    }
    active_segments_.erase(it);
}

int64_t StreamLog::append(const std::string& scope, const std::string& stream,
                          const std::string& payload, const std::string& writer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    SegmentInfo* seg = get_or_create_segment(scope, stream);
    int64_t position = seg->next_position;

    StreamRecord record;
    record.set_scope(scope);
    record.set_stream(stream);
    record.set_position(position);
    record.set_ts_append(now_ns());
    record.set_payload(payload);
    record.set_writer_id(writer_id);

    std::string serialized;
    if (!record.SerializeToString(&serialized)) {
        throw client::StreamError("Failed to serialize StreamRecord");
    }

    int64_t file_offset = seg->file_size;
    uint32_t length = static_cast<uint32_t>(serialized.size());

    if (config_.use_buffering) {
        const char* length_bytes = reinterpret_cast<const char*>(&length);
        seg->log_buffer.insert(seg->log_buffer.end(), length_bytes, length_bytes + sizeof(length));
        seg->log_buffer.insert(seg->log_buffer.end(), serialized.begin(), serialized.end());

        const char* position_bytes = reinterpret_cast<const char*>(&position);
        const char* offset_bytes = reinterpret_cast<const char*>(&file_offset);
        seg->idx_buffer.insert(seg->idx_buffer.end(), position_bytes, position_bytes + sizeof(position));
        seg->idx_buffer.insert(seg->idx_buffer.end(), offset_bytes, offset_bytes + sizeof(file_offset));

        if (seg->log_buffer.size() >= SegmentInfo::BUFFER_SIZE) {
            flush_segment_buffers(seg);
        }
    } else {
        seg->log_file->write(reinterpret_cast<const char*>(&length), sizeof(length));
        seg->log_file->write(serialized.data(), serialized.size());
        seg->idx_file->write(reinterpret_cast<const char*>(&position), sizeof(position));
        seg->idx_file->write(reinterpret_cast<const char*>(&file_offset), sizeof(file_offset));
        seg->log_file->flush();
        seg->idx_file->flush();
        if (seg->log_file->fail() || seg->idx_file->fail()) {
            throw client::StreamError("Failed to write segment " + seg->log_path);
        }
    }

    seg->file_size += sizeof(length) + serialized.size();
    seg->next_position++;
    return position;
}

void StreamLog::open_segment_files(SegmentInfo* seg) {
    if (!seg->log_file) {
        seg->log_file = std::make_unique<std::ofstream>(seg->log_path, std::ios::binary | std::ios::app);
        if (!seg->log_file->is_open()) {
            throw client::StreamError("Failed to open log file: " + seg->log_path);
        }
    }
    if (!seg->idx_file) {
        seg->idx_file = std::make_unique<std::ofstream>(seg->idx_path, std::ios::binary | std::ios::app);
        if (!seg->idx_file->is_open()) {
            throw client::StreamError("Failed to open index file: " + seg->idx_path);
        }
    }
}

void StreamLog::flush_segment_buffers(SegmentInfo* seg) {
    if (!seg) return;

    if (seg->log_file && !seg->log_buffer.empty()) {
        seg->log_file->write(seg->log_buffer.data(), seg->log_buffer.size());
        seg->log_buffer.clear();
        seg->log_file->flush();
    }
    if (seg->idx_file && !seg->idx_buffer.empty()) {
        seg->idx_file->write(seg->idx_buffer.data(), seg->idx_buffer.size());
        seg->idx_buffer.clear();
        seg->idx_file->flush();
    }
}

void StreamLog::close_segment_files(SegmentInfo* seg) {
    if (!seg) return;

    flush_segment_buffers(seg);
    if (seg->log_file) {
        seg->log_file->close();
        seg->log_file.reset();
    }
    if (seg->idx_file) {
        seg->idx_file->close();
        seg->idx_file.reset();
    }
}

void StreamLog::flush_all_segments() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, seg] : active_segments_) {
        flush_segment_buffers(seg.get());
    }
}

std::vector<StreamRecord> StreamLog::read(const std::string& scope, const std::string& stream,
                                          int64_t position, int64_t max_records) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Buffered appends must be visible to readers
    auto active = active_segments_.find(key_for(scope, stream));
    if (active != active_segments_.end()) {
        flush_segment_buffers(active->second.get());
    }

    std::vector<StreamRecord> records;
    auto segments = get_segments_for_stream(scope, stream);

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& [seg_base, log_path] = segments[i];
        if (i + 1 < segments.size() && segments[i + 1].first <= position) {
            continue;
        }

        std::string idx_path = log_path;
        idx_path.replace(idx_path.size() - 4, 4, ".idx");

        std::ifstream idx_file(idx_path, std::ios::binary);
        if (!idx_file.is_open()) continue;

        idx_file.seekg(0, std::ios::end);
        int64_t idx_size = static_cast<int64_t>(idx_file.tellg());
        if (idx_size < INDEX_ENTRY_SIZE) continue;

        // Binary search for the first entry at or after position
        int64_t file_offset = 0;
        bool found = false;
        int64_t left = 0, right = idx_size / INDEX_ENTRY_SIZE - 1;
        while (left <= right) {
            int64_t mid = left + (right - left) / 2;
            idx_file.seekg(mid * INDEX_ENTRY_SIZE, std::ios::beg);

            int64_t idx_position;
            int64_t idx_offset;
            idx_file.read(reinterpret_cast<char*>(&idx_position), sizeof(idx_position));
            idx_file.read(reinterpret_cast<char*>(&idx_offset), sizeof(idx_offset));
            if (idx_file.fail()) break;

            if (idx_position < position) {
                left = mid + 1;
            } else {
                file_offset = idx_offset;
                found = true;
                right = mid - 1;
            }
        }
        if (!found) continue;

        std::ifstream log_file(log_path, std::ios::binary);
        if (!log_file.is_open()) continue;
        log_file.seekg(file_offset, std::ios::beg);

        while (records.size() < static_cast<size_t>(max_records)) {
            uint32_t length;
            log_file.read(reinterpret_cast<char*>(&length), sizeof(length));
            if (log_file.fail() || length == 0) break;

            std::string buffer(length, '\0');
            log_file.read(&buffer[0], length);
            if (log_file.fail()) break;

            StreamRecord record;
            if (!record.ParseFromString(buffer)) {
                std::cerr << "StreamLog: Corrupt record in " << log_path << " at offset "
                          << file_offset << std::endl;
                break;
            }
            if (record.position() >= position) {
                records.push_back(std::move(record));
            }
        }

        if (records.size() >= static_cast<size_t>(max_records)) break;
    }

    return records;
}

int64_t StreamLog::end_position(const std::string& scope, const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::is_directory(stream_dir(scope, stream))) {
        return 0;
    }
    return get_or_create_segment(scope, stream)->next_position;
}

std::map<std::string, int64_t>& StreamLog::positions_for(const std::string& scope, const std::string& group) {
    const std::string key = key_for(scope, group);
    auto it = group_positions_.find(key);
    if (it != group_positions_.end()) {
        return it->second;
    }

    std::map<std::string, int64_t>& positions = group_positions_[key];
    fs::path dir(group_dir(scope, group));
    if (!fs::exists(dir)) {
        return positions;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() != ".pos") continue;
        std::ifstream file(entry.path(), std::ios::binary);
        int64_t position;
        file.read(reinterpret_cast<char*>(&position), sizeof(position));
        if (!file.fail()) {
            positions[entry.path().stem().string()] = position;
        }
    }
    return positions;
}

void StreamLog::commit_position(const std::string& scope, const std::string& group,
                                const std::string& stream, int64_t position) {
    validate_name("reader group", group);
    std::lock_guard<std::mutex> lock(mutex_);
    positions_for(scope, group)[stream] = position;

    fs::path dir(group_dir(scope, group));
    fs::create_directories(dir);
    std::ofstream file(dir / (stream + ".pos"), std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(&position), sizeof(position));
    if (file.fail()) {
        throw client::StreamError("Failed to persist position of group " + group + " on stream " + stream);
    }
}

int64_t StreamLog::load_position(const std::string& scope, const std::string& group,
                                 const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& positions = positions_for(scope, group);
    auto it = positions.find(stream);
    return it == positions.end() ? 0 : it->second;
}

void StreamLog::clear_positions(const std::string& scope, const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    group_positions_[key_for(scope, group)].clear();
    std::error_code ec;
    fs::remove_all(group_dir(scope, group), ec);
    if (ec) {
        throw client::StreamError("Failed to clear positions of group " + group + ": " + ec.message());
    }
}

} // namespace storage
} // namespace kbridge
