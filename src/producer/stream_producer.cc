/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_producer.cc
 * Description: Implementation of StreamProducer: writer cache, send pipeline and
 *              the completion thread that settles sends in FIFO order.
 */

#include "kbridge/producer/stream_producer.h"
#include "kbridge/client/errors.h"
#include "kbridge/interceptors/interceptor_registry.h"
#include <iostream>
#include <utility>

namespace kbridge {
namespace producer {

using client::IllegalArgumentError;
using client::IllegalStateError;
using client::UnsupportedOperationError;

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string describe(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace

StreamProducer::StreamProducer(const client::ClientConfig& config,
                               std::shared_ptr<client::StreamClientFactory> factory,
                               std::vector<std::shared_ptr<ProducerInterceptor>> interceptors)
    : factory_(std::move(factory)),
      endpoints_(config.server_endpoints()),
      scope_(config.scope()),
      serializer_(config.serializer()) {
    if (!factory_) {
        throw IllegalArgumentError("StreamProducer requires a stream client factory");
    }

    auto configured = interceptors::InterceptorRegistry::instance()
        .create_producer_interceptors(config.interceptor_classes());
    for (auto& interceptor : configured) {
        interceptors_.add(std::move(interceptor));
    }
    for (auto& interceptor : interceptors) {
        interceptors_.add(std::move(interceptor));
    }

    completion_thread_ = std::thread([this]() { run_completions(); });

    std::cout << "StreamProducer: created for scope " << scope_ << " at " << endpoints_
              << " (serializer " << serializer_->name() << ")" << std::endl;
}

StreamProducer::~StreamProducer() {
    close();
}

SendFuture StreamProducer::send(const ProducerRecord& record, SendCallback callback) {
    ensure_not_closed();
    if (record.topic.empty()) {
        throw IllegalArgumentError("Topic must not be empty");
    }

    ProducerRecord outbound = interceptors_.on_send(record);
    if (outbound.topic.empty()) {
        throw IllegalArgumentError("Topic must not be empty");
    }

    PendingRecord pending;
    pending.topic = outbound.topic;
    pending.key_size = outbound.key ? static_cast<int32_t>(outbound.key->size()) : 0;
    pending.value_size = static_cast<int32_t>(outbound.value.size());
    pending.callback = std::move(callback);
    SendFuture result = pending.promise.get_future();

    try {
        std::string payload = serializer_->encode(outbound.key, outbound.value, outbound.headers);
        pending.write = writer_for(outbound.topic).write_event(payload);
    } catch (...) {
        // Surface synchronous failures the same way as a failed write
        std::promise<void> failed;
        failed.set_exception(std::current_exception());
        pending.write = failed.get_future();
    }

    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (stopping_) {
            stopped = true;
        } else {
            pending_.push_back(std::move(pending));
            ++enqueued_;
        }
    }
    if (stopped) {
        // The completion thread is gone: a close finished while this send was writing
        std::promise<void> rejected;
        rejected.set_exception(std::make_exception_ptr(
            IllegalStateError("Producer closed before the send to " + pending.topic + " completed")));
        pending.write = rejected.get_future();
        complete(pending);
        return result;
    }
    pending_cv_.notify_one();
    return result;
}

client::StreamWriter& StreamProducer::writer_for(const std::string& topic) {
    std::lock_guard<std::mutex> lock(writers_mutex_);
    if (writers_closed_) {
        throw IllegalStateError("Cannot create a writer for " + topic + " after the producer is closed");
    }
    client::StreamWriter* existing = writers_.find(topic);
    if (existing) {
        return *existing;
    }
    std::unique_ptr<client::StreamWriter> writer = factory_->create_writer(scope_, topic);
    writer->init();
    client::StreamWriter& ref = *writer;
    writers_.insert(topic, std::move(writer));
    return ref;
}

void StreamProducer::run_completions() {
    while (true) {
        PendingRecord pending;
        {
            std::unique_lock<std::mutex> lock(pending_mutex_);
            pending_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
            if (pending_.empty()) {
                return;
            }
            pending = std::move(pending_.front());
            pending_.pop_front();
        }

        complete(pending);

        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            ++settled_;
        }
        settled_cv_.notify_all();
    }
}

void StreamProducer::complete(PendingRecord& pending) {
    std::exception_ptr fault;
    try {
        pending.write.get();
    } catch (...) {
        fault = std::current_exception();
    }

    std::optional<RecordMetadata> metadata;
    std::exception_ptr callback_error;
    if (fault) {
        // Write faults are reported here and never reach the future
        std::cerr << "StreamProducer: Failed to write event to stream " << pending.topic
                  << ": " << describe(fault) << std::endl;
        callback_error = std::make_exception_ptr(
            SendError("Send to " + pending.topic + " failed: " + describe(fault), fault));
    } else {
        RecordMetadata md;
        md.topic = pending.topic;
        md.timestamp = now_ms();
        md.serialized_key_size = pending.key_size;
        md.serialized_value_size = pending.value_size;
        metadata = md;
    }

    interceptors_.on_acknowledgement(metadata, fault);
    pending.promise.set_value(metadata);

    if (pending.callback) {
        try {
            pending.callback(metadata, callback_error);
        } catch (const std::exception& e) {
            std::cerr << "StreamProducer: Send callback for stream " << pending.topic
                      << " threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "StreamProducer: Send callback for stream " << pending.topic
                      << " threw a non-standard exception" << std::endl;
        }
    }
}

void StreamProducer::wait_for_settled(uint64_t target) {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    settled_cv_.wait(lock, [this, target]() { return settled_ >= target; });
}

void StreamProducer::flush() {
    uint64_t target;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        target = enqueued_;
    }

    {
        std::lock_guard<std::mutex> lock(writers_mutex_);
        for (const auto& entry : writers_) {
            try {
                entry.handle->flush();
            } catch (const std::exception& e) {
                std::cerr << "StreamProducer: Unable to flush writer for stream "
                          << entry.destination << ": " << e.what() << std::endl;
            }
        }
    }

    wait_for_settled(target);
}

std::vector<consumer::PartitionInfo> StreamProducer::partitions_for(const std::string& /*topic*/) const {
    return {};
}

std::map<std::string, double> StreamProducer::metrics() const {
    return {};
}

void StreamProducer::init_transactions() {
    throw UnsupportedOperationError("Transactions are not supported");
}

void StreamProducer::begin_transaction() {
    throw UnsupportedOperationError("Transactions are not supported");
}

void StreamProducer::send_offsets_to_transaction(
    const std::map<consumer::TopicPartition, consumer::OffsetAndMetadata>& /*offsets*/,
    const std::string& /*group_id*/) {
    throw UnsupportedOperationError("Transactions are not supported");
}

void StreamProducer::commit_transaction() {
    throw UnsupportedOperationError("Transactions are not supported");
}

void StreamProducer::abort_transaction() {
    throw UnsupportedOperationError("Transactions are not supported");
}

void StreamProducer::close() {
    if (closed_.exchange(true)) {
        return;
    }

    flush();

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stopping_ = true;
    }
    pending_cv_.notify_all();
    if (completion_thread_.joinable()) {
        completion_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(writers_mutex_);
        writers_closed_ = true;
        writers_.close_all("StreamProducer");
    }
    interceptors_.close();
    std::cout << "StreamProducer: closed" << std::endl;
}

void StreamProducer::close(std::chrono::milliseconds /*timeout*/) {
    close();
}

void StreamProducer::ensure_not_closed() const {
    if (closed_.load()) {
        throw IllegalStateError("Cannot send after the producer is closed");
    }
}

} // namespace producer
} // namespace kbridge
