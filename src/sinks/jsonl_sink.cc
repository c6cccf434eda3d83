/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: jsonl_sink.cc
 * Description: Implementation of JSONLSink.
 */

#include "kbridge/sinks/jsonl_sink.h"
#include <iostream>

namespace kbridge {
namespace sinks {

JSONLSink::JSONLSink(const std::string& file_path)
    : file_path_(file_path), opened_(false) {
    file_.open(file_path_, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "JSONLSink: Failed to open JSONL file: " << file_path_ << std::endl;
    } else {
        opened_ = true;
    }
}

JSONLSink::~JSONLSink() {
    close();
}

bool JSONLSink::emit(const consumer::ConsumerRecord& record) {
    if (!opened_ || !file_.is_open()) {
        return false;
    }
    std::string json;
    if (!to_json_line(record, json)) {
        return false;
    }
    file_ << json << "\n";
    return true;
}

void JSONLSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void JSONLSink::close() {
    if (file_.is_open()) {
        file_.close();
        opened_ = false;
    }
}

} // namespace sinks
} // namespace kbridge
