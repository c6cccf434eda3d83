#include "kbridge/consumer/consumer_interceptor.h"
#include "kbridge/consumer/stream_consumer.h"
#include "kbridge/producer/producer_interceptor.h"
#include "kbridge/producer/stream_producer.h"
#include "kbridge/interceptors/builtin_interceptors.h"
#include "kbridge/interceptors/interceptor_registry.h"
#include "kbridge/client/errors.h"
#include "stub_streams.h"
#include <atomic>
#include <cassert>
#include <cctype>
#include <iostream>
#include <memory>
#include <stdexcept>

using kbridge::consumer::ConsumerInterceptor;
using kbridge::consumer::ConsumerInterceptors;
using kbridge::consumer::ConsumerRecord;
using kbridge::consumer::ConsumerRecords;
using kbridge::consumer::TopicPartition;
using kbridge::producer::ProducerInterceptor;
using kbridge::producer::ProducerInterceptors;
using kbridge::producer::ProducerRecord;
using kbridge::producer::RecordMetadata;

namespace {

ConsumerRecords make_batch(const std::string& topic, int count) {
    std::vector<ConsumerRecord> records;
    for (int i = 0; i < count; ++i) {
        ConsumerRecord record;
        record.topic = topic;
        record.value = topic + "-" + std::to_string(i);
        records.push_back(record);
    }
    ConsumerRecords batch;
    batch.append(TopicPartition{topic, 0}, std::move(records));
    return batch;
}

// Upper-cases every value
class UpperCaseInterceptor : public ConsumerInterceptor {
public:
    std::string name() const override { return "upper"; }
    ConsumerRecords on_consume(const ConsumerRecords& records) override {
        ConsumerRecords result = records;
        for (auto& [tp, batch] : result.by_partition()) {
            for (auto& record : batch) {
                for (auto& c : record.value) {
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }
            }
        }
        return result;
    }
};

// Fails in every hook
class BrokenConsumerInterceptor : public ConsumerInterceptor {
public:
    std::string name() const override { return "broken"; }
    ConsumerRecords on_consume(const ConsumerRecords& /*records*/) override {
        throw std::runtime_error("interceptor bug");
    }
    void on_commit(const std::map<TopicPartition, kbridge::consumer::OffsetAndMetadata>&) override {
        throw std::runtime_error("commit hook bug");
    }
    void close() override {
        closed++;
        throw std::runtime_error("close bug");
    }
    int closed = 0;
};

class SuffixInterceptor : public ProducerInterceptor {
public:
    explicit SuffixInterceptor(std::string suffix) : suffix_(std::move(suffix)) {}
    std::string name() const override { return "suffix" + suffix_; }
    ProducerRecord on_send(const ProducerRecord& record) override {
        ProducerRecord result = record;
        result.value += suffix_;
        return result;
    }
    void on_acknowledgement(const std::optional<RecordMetadata>& metadata, std::exception_ptr error) override {
        if (metadata && !error) {
            acknowledged++;
        }
    }
    std::atomic<int> acknowledged{0};

private:
    std::string suffix_;
};

class BrokenProducerInterceptor : public ProducerInterceptor {
public:
    std::string name() const override { return "broken"; }
    ProducerRecord on_send(const ProducerRecord& /*record*/) override {
        throw std::runtime_error("send hook bug");
    }
    void on_acknowledgement(const std::optional<RecordMetadata>&, std::exception_ptr) override {
        throw std::runtime_error("ack hook bug");
    }
};

kbridge::client::ClientConfig stub_config() {
    kbridge::client::ClientConfig config;
    config.set(kbridge::client::ClientConfig::BOOTSTRAP_SERVERS, "stub:9092");
    config.set(kbridge::client::ClientConfig::READ_TIMEOUT_MS, "5");
    return config;
}

} // namespace

void test_consumer_chain_isolation() {
    std::cout << "Testing consumer interceptor chain..." << std::endl;

    auto broken = std::make_shared<BrokenConsumerInterceptor>();
    ConsumerInterceptors chain;
    chain.add(std::make_shared<UpperCaseInterceptor>());
    chain.add(broken);
    chain.add(std::make_shared<kbridge::interceptors::CountingConsumerInterceptor>());

    ConsumerRecords result = chain.on_consume(make_batch("orders", 3));
    assert(result.count() == 3);
    assert(result.records("orders")[0].value == "ORDERS-0");
    std::cout << "  ✓ Failing interceptor skipped, earlier output kept" << std::endl;

    chain.on_commit({});
    chain.close();
    assert(broken->closed == 1);
    std::cout << "  ✓ Commit and close failures absorbed" << std::endl;
}

void test_producer_chain_isolation() {
    std::cout << "Testing producer interceptor chain..." << std::endl;

    ProducerInterceptors chain;
    chain.add(std::make_shared<SuffixInterceptor>("-a"));
    chain.add(std::make_shared<BrokenProducerInterceptor>());
    chain.add(std::make_shared<SuffixInterceptor>("-b"));

    ProducerRecord result = chain.on_send(ProducerRecord("orders", "v"));
    assert(result.value == "v-a-b");
    std::cout << "  ✓ Rewrites applied around the failing interceptor" << std::endl;

    chain.on_acknowledgement(RecordMetadata{}, nullptr);
    chain.close();
    std::cout << "  ✓ Acknowledgement failures absorbed" << std::endl;
}

void test_registry_resolution() {
    std::cout << "Testing interceptor registry..." << std::endl;

    auto& registry = kbridge::interceptors::InterceptorRegistry::instance();
    assert(registry.has_consumer("logging"));
    assert(registry.has_consumer("counting"));
    assert(registry.has_producer("counting"));

    auto consumers = registry.create_consumer_interceptors({"counting", "logging"});
    assert(consumers.size() == 2);
    assert(consumers[0]->name() == "counting");
    assert(consumers[1]->name() == "logging");
    std::cout << "  ✓ Built-ins created in the requested order" << std::endl;

    bool rejected = false;
    try {
        registry.create_producer_interceptors({"no-such-interceptor"});
    } catch (const kbridge::client::IllegalArgumentError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "  ✓ Unknown interceptor name rejected" << std::endl;
}

void test_configured_interceptors_run() {
    std::cout << "Testing interceptors named in config..." << std::endl;

    auto counter = std::make_shared<kbridge::interceptors::CountingConsumerInterceptor>();
    auto& registry = kbridge::interceptors::InterceptorRegistry::instance();
    registry.register_consumer("test-counter", [counter]() { return counter; });

    auto factory = std::make_shared<stub::StubFactory>();
    factory->script("orders", 4);

    auto config = stub_config();
    config.set(kbridge::client::ClientConfig::INTERCEPTOR_CLASSES, "test-counter, logging");
    kbridge::consumer::StreamConsumer consumer(config, factory, {std::make_shared<UpperCaseInterceptor>()});
    consumer.subscribe({"orders"});

    auto records = consumer.poll(50);
    assert(records.count() == 4);
    assert(records.records("orders")[0].value == "ORDERS-0");
    assert(counter->batches() == 1);
    assert(counter->records() == 4);
    std::cout << "  ✓ Configured and explicit interceptors both applied" << std::endl;
}

void test_producer_acknowledgements() {
    std::cout << "Testing producer acknowledgements..." << std::endl;

    auto factory = std::make_shared<stub::StubFactory>();
    factory->ledger().failing_writes.insert("bad");

    auto suffix = std::make_shared<SuffixInterceptor>("!");
    auto counting = std::make_shared<kbridge::interceptors::CountingProducerInterceptor>();
    kbridge::producer::StreamProducer producer(stub_config(), factory, {suffix, counting});

    producer.send(ProducerRecord("good", "x"));
    producer.send(ProducerRecord("good", "y"));
    producer.send(ProducerRecord("bad", "z"));
    producer.flush();

    assert(factory->ledger().written["good"][0] == "x!");
    assert(suffix->acknowledged == 2);
    assert(counting->sent() == 3);
    assert(counting->acknowledged() == 2);
    assert(counting->failed() == 1);
    std::cout << "  ✓ on_send and on_acknowledgement saw every record" << std::endl;
}

int main() {
    std::cout << "Running interceptor tests..." << std::endl;
    test_consumer_chain_isolation();
    test_producer_chain_isolation();
    test_registry_resolution();
    test_configured_interceptors_run();
    test_producer_acknowledgements();
    std::cout << "\nAll interceptor tests passed!" << std::endl;
    return 0;
}
