#include "kbridge/producer/stream_producer.h"
#include "kbridge/client/errors.h"
#include "stub_streams.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using kbridge::client::ClientConfig;
using kbridge::producer::ProducerRecord;
using kbridge::producer::RecordMetadata;
using kbridge::producer::SendError;
using kbridge::producer::StreamProducer;

namespace {

ClientConfig stub_config() {
    ClientConfig config;
    config.set(ClientConfig::CONTROLLER_URI, "stub:9090");
    return config;
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

// Writer whose write_event blocks until the test opens the gate
class GateWriter : public kbridge::client::StreamWriter {
public:
    explicit GateWriter(std::string stream) : stream_(std::move(stream)) {}

    void init() override {}

    std::future<void> write_event(const std::string& /*payload*/) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return open_; });
        std::promise<void> promise;
        promise.set_value();
        return promise.get_future();
    }

    void flush() override {}
    void close() override {}
    const std::string& stream() const override { return stream_; }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return entered_; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    std::string stream_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

// Hands out one shared GateWriter; the producer only borrows it
class GateFactory : public kbridge::client::StreamClientFactory {
public:
    GateFactory() : gate_(std::make_shared<GateWriter>("orders")) {}

    std::unique_ptr<kbridge::client::StreamReader> create_reader(const std::string&, const std::string& stream,
                                                                 const std::string&, const std::string&) override {
        throw kbridge::client::StreamError("no readers for " + stream);
    }

    std::unique_ptr<kbridge::client::StreamWriter> create_writer(const std::string& /*scope*/,
                                                                 const std::string& /*stream*/) override {
        return std::make_unique<Forward>(gate_);
    }

    GateWriter& gate() { return *gate_; }

private:
    class Forward : public kbridge::client::StreamWriter {
    public:
        explicit Forward(std::shared_ptr<GateWriter> gate) : gate_(std::move(gate)) {}
        void init() override { gate_->init(); }
        std::future<void> write_event(const std::string& payload) override { return gate_->write_event(payload); }
        void flush() override { gate_->flush(); }
        void close() override { gate_->close(); }
        const std::string& stream() const override { return gate_->stream(); }

    private:
        std::shared_ptr<GateWriter> gate_;
    };

    std::shared_ptr<GateWriter> gate_;
};

} // namespace

void test_send_success() {
    std::cout << "Testing successful send..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    StreamProducer producer(stub_config(), factory);

    std::atomic<int> callbacks{0};
    auto future = producer.send(ProducerRecord("orders", "k", "hello"),
        [&callbacks](const std::optional<RecordMetadata>& metadata, std::exception_ptr error) {
            assert(metadata.has_value());
            assert(!error);
            callbacks++;
        });

    auto metadata = future.get();
    assert(metadata.has_value());
    assert(metadata->topic == "orders");
    assert(metadata->partition == -1);
    assert(metadata->offset == -1);
    assert(metadata->timestamp > 0);
    assert(metadata->serialized_value_size == 5);
    std::cout << "  ✓ Future resolved with placeholder metadata" << std::endl;

    producer.flush();
    assert(callbacks == 1);
    assert(factory->ledger().written["orders"].size() == 1);
    assert(factory->ledger().written["orders"][0] == "hello");
    std::cout << "  ✓ Callback invoked once and value written as payload" << std::endl;
}

void test_writer_cached_per_topic() {
    std::cout << "Testing writer cache..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    StreamProducer producer(stub_config(), factory);

    for (int i = 0; i < 5; ++i) {
        producer.send(ProducerRecord("orders", "v" + std::to_string(i)));
    }
    producer.send(ProducerRecord("payments", "p"));
    producer.flush();

    auto& ledger = factory->ledger();
    assert(ledger.writers_created["orders"] == 1);
    assert(ledger.writers_created["payments"] == 1);
    assert(ledger.writers_initialized["orders"] == 1);
    assert(ledger.written["orders"].size() == 5);
    assert(ledger.written["orders"][4] == "v4");
    std::cout << "  ✓ One initialized writer per topic, writes in order" << std::endl;
}

void test_failed_write_is_swallowed_by_future() {
    std::cout << "Testing failed write..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    factory->ledger().failing_writes.insert("orders");
    StreamProducer producer(stub_config(), factory);

    std::exception_ptr seen;
    std::atomic<int> callbacks{0};
    auto future = producer.send(ProducerRecord("orders", "lost"),
        [&](const std::optional<RecordMetadata>& metadata, std::exception_ptr error) {
            assert(!metadata.has_value());
            seen = error;
            callbacks++;
        });

    // The future never carries the fault
    auto metadata = future.get();
    assert(!metadata.has_value());
    producer.flush();
    assert(callbacks == 1);
    assert(seen);
    std::cout << "  ✓ Future resolved empty" << std::endl;

    try {
        std::rethrow_exception(seen);
    } catch (const SendError& e) {
        assert(e.cause());
        assert(throws<kbridge::client::StreamError>([&]() { std::rethrow_exception(e.cause()); }));
        std::cout << "  ✓ Callback received SendError: " << e.what() << std::endl;
    }
}

void test_completion_order() {
    std::cout << "Testing completion order..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    StreamProducer producer(stub_config(), factory);

    std::vector<int> order;
    std::mutex order_mutex;
    for (int i = 0; i < 20; ++i) {
        producer.send(ProducerRecord(i % 2 ? "odd" : "even", std::to_string(i)),
            [i, &order, &order_mutex](const std::optional<RecordMetadata>&, std::exception_ptr) {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            });
    }
    producer.flush();

    assert(order.size() == 20);
    for (int i = 0; i < 20; ++i) {
        assert(order[i] == i);
    }
    std::cout << "  ✓ Callbacks ran in send order" << std::endl;
}

void test_flush_isolates_writer_failures() {
    std::cout << "Testing flush with failing writer..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    factory->ledger().failing_flushes.insert("orders");
    StreamProducer producer(stub_config(), factory);

    producer.send(ProducerRecord("orders", "a"));
    producer.send(ProducerRecord("payments", "b"));
    producer.flush();

    assert(factory->ledger().writers_flushed["orders"] == 1);
    assert(factory->ledger().writers_flushed["payments"] == 1);
    std::cout << "  ✓ Every writer flushed despite a failure" << std::endl;
}

void test_callback_exceptions_do_not_escape() {
    std::cout << "Testing throwing callback..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    StreamProducer producer(stub_config(), factory);

    auto first = producer.send(ProducerRecord("orders", "a"),
        [](const std::optional<RecordMetadata>&, std::exception_ptr) {
            throw std::runtime_error("callback bug");
        });
    auto second = producer.send(ProducerRecord("orders", "b"),
        [](const std::optional<RecordMetadata>&, std::exception_ptr) {
            throw 42;
        });
    auto third = producer.send(ProducerRecord("orders", "c"));

    assert(first.get().has_value());
    assert(second.get().has_value());
    assert(third.get().has_value());
    std::cout << "  ✓ Later sends complete after throwing callbacks" << std::endl;
}

void test_producer_usage_errors() {
    std::cout << "Testing producer usage errors..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    StreamProducer producer(stub_config(), factory);

    assert(throws<kbridge::client::IllegalArgumentError>([&]() {
        producer.send(ProducerRecord("", "x"));
    }));
    assert(throws<kbridge::client::UnsupportedOperationError>([&]() { producer.init_transactions(); }));
    assert(throws<kbridge::client::UnsupportedOperationError>([&]() { producer.begin_transaction(); }));
    assert(throws<kbridge::client::UnsupportedOperationError>([&]() { producer.commit_transaction(); }));
    assert(throws<kbridge::client::UnsupportedOperationError>([&]() { producer.abort_transaction(); }));
    assert(producer.partitions_for("orders").empty());
    assert(producer.metrics().empty());
    std::cout << "  ✓ Empty topic and transactions rejected" << std::endl;

    ClientConfig no_endpoint;
    assert(throws<kbridge::client::IllegalArgumentError>([&]() {
        StreamProducer missing(no_endpoint, factory);
    }));
    std::cout << "  ✓ Missing endpoint rejected" << std::endl;
}

void test_close_drains_and_closes_writers() {
    std::cout << "Testing producer close..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    StreamProducer producer(stub_config(), factory);

    std::atomic<int> callbacks{0};
    for (int i = 0; i < 10; ++i) {
        producer.send(ProducerRecord("orders", std::to_string(i)),
            [&callbacks](const std::optional<RecordMetadata>&, std::exception_ptr) { callbacks++; });
    }
    producer.close();
    assert(callbacks == 10);
    assert(factory->ledger().writers_closed["orders"] == 1);
    std::cout << "  ✓ Pending sends completed before writers closed" << std::endl;

    producer.close();
    assert(factory->ledger().writers_closed["orders"] == 1);
    assert(throws<kbridge::client::IllegalStateError>([&]() {
        producer.send(ProducerRecord("orders", "late"));
    }));
    std::cout << "  ✓ Close is idempotent and blocks later sends" << std::endl;
}

void test_send_racing_close_is_settled() {
    std::cout << "Testing send overlapping close..." << std::endl;

    auto factory = std::make_shared<GateFactory>();
    auto producer = std::make_unique<StreamProducer>(stub_config(), factory);

    std::atomic<int> callbacks{0};
    std::exception_ptr callback_error;
    bool callback_had_metadata = true;
    kbridge::producer::SendFuture late;
    std::thread sender([&]() {
        late = producer->send(ProducerRecord("orders", "late"),
            [&](const std::optional<RecordMetadata>& metadata, std::exception_ptr error) {
                callback_had_metadata = metadata.has_value();
                callback_error = error;
                callbacks++;
            });
    });

    factory->gate().wait_entered();
    producer->close();
    factory->gate().open();
    sender.join();

    assert(callbacks == 1);
    assert(!callback_had_metadata);
    assert(callback_error);
    try {
        std::rethrow_exception(callback_error);
    } catch (const SendError& e) {
        assert(e.cause());
        assert(throws<kbridge::client::IllegalStateError>([&]() { std::rethrow_exception(e.cause()); }));
    }
    std::cout << "  ✓ Callback invoked once with the close as cause" << std::endl;

    assert(late.wait_for(std::chrono::seconds(1)) == std::future_status::ready);
    assert(!late.get().has_value());
    producer.reset();
    assert(callbacks == 1);
    std::cout << "  ✓ Future resolved empty instead of breaking" << std::endl;
}

void test_envelope_serializer() {
    std::cout << "Testing envelope serializer..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    ClientConfig config = stub_config();
    config.set(ClientConfig::VALUE_SERIALIZER, "envelope");
    StreamProducer producer(config, factory);

    ProducerRecord record("orders", "id-7", "payload");
    record.headers["trace"] = "abc";
    producer.send(record);
    producer.flush();

    kbridge::client::EnvelopeCodec codec;
    auto decoded = codec.decode(factory->ledger().written["orders"].at(0));
    assert(decoded.key == std::optional<std::string>("id-7"));
    assert(decoded.value == "payload");
    assert(decoded.headers.at("trace") == "abc");
    std::cout << "  ✓ Key and headers carried in the envelope" << std::endl;
}

int main() {
    std::cout << "Running StreamProducer tests..." << std::endl;
    test_send_success();
    test_writer_cached_per_topic();
    test_failed_write_is_swallowed_by_future();
    test_completion_order();
    test_flush_isolates_writer_failures();
    test_callback_exceptions_do_not_escape();
    test_producer_usage_errors();
    test_close_drains_and_closes_writers();
    test_send_racing_close_is_settled();
    test_envelope_serializer();
    std::cout << "\nAll StreamProducer tests passed!" << std::endl;
    return 0;
}
