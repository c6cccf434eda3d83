/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stdout_sink.cc
 * Description: Implementation of StdoutSink.
 */

#include "kbridge/sinks/stdout_sink.h"
#include <iostream>

namespace kbridge {
namespace sinks {

bool StdoutSink::emit(const consumer::ConsumerRecord& record) {
    std::string json;
    if (!to_json_line(record, json)) {
        return false;
    }
    std::cout << json << std::endl;
    return true;
}

void StdoutSink::flush() {
    std::cout.flush();
}

} // namespace sinks
} // namespace kbridge
