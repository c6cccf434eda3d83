/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: jsonl_sink.h
 * Description: Header for JSONLSink, which appends consumed records to a JSON
 *              Lines file.
 */

#pragma once

#include "kbridge/sinks/record_sink.h"
#include <fstream>
#include <string>

namespace kbridge {
namespace sinks {

class JSONLSink : public RecordSink {
public:
    explicit JSONLSink(const std::string& file_path);
    ~JSONLSink();

    bool emit(const consumer::ConsumerRecord& record) override;
    void flush() override;
    void close() override;

    bool is_open() const { return opened_; }

private:
    std::string file_path_;
    std::ofstream file_;
    bool opened_;
};

} // namespace sinks
} // namespace kbridge
