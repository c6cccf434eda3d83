/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: builtin_interceptors.cc
 * Description: Implementation of the logging and counting interceptors.
 */

#include "kbridge/interceptors/builtin_interceptors.h"
#include <iostream>

namespace kbridge {
namespace interceptors {

consumer::ConsumerRecords LoggingConsumerInterceptor::on_consume(const consumer::ConsumerRecords& records) {
    if (!records.empty()) {
        std::cout << "LoggingConsumerInterceptor: polled " << records.count() << " records from "
                  << records.partitions().size() << " partitions" << std::endl;
    }
    return records;
}

producer::ProducerRecord LoggingProducerInterceptor::on_send(const producer::ProducerRecord& record) {
    return record;
}

void LoggingProducerInterceptor::on_acknowledgement(const std::optional<producer::RecordMetadata>& metadata,
                                                    std::exception_ptr error) {
    if (!error) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "LoggingProducerInterceptor: send to "
                  << (metadata ? metadata->topic : std::string("<unknown>"))
                  << " failed: " << e.what() << std::endl;
    }
}

consumer::ConsumerRecords CountingConsumerInterceptor::on_consume(const consumer::ConsumerRecords& records) {
    batches_++;
    records_ += records.count();
    return records;
}

producer::ProducerRecord CountingProducerInterceptor::on_send(const producer::ProducerRecord& record) {
    sent_++;
    return record;
}

void CountingProducerInterceptor::on_acknowledgement(const std::optional<producer::RecordMetadata>& /*metadata*/,
                                                     std::exception_ptr error) {
    if (error) {
        failed_++;
    } else {
        acknowledged_++;
    }
}

} // namespace interceptors
} // namespace kbridge
