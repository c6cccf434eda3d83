/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stdout_sink.h
 * Description: Header for StdoutSink, which writes consumed records to standard
 *              output as one JSON object per line.
 */

#pragma once

#include "kbridge/sinks/record_sink.h"

namespace kbridge {
namespace sinks {

class StdoutSink : public RecordSink {
public:
    bool emit(const consumer::ConsumerRecord& record) override;
    void flush() override;
};

} // namespace sinks
} // namespace kbridge
