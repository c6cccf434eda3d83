#include "kbridge/client/client_config.h"
#include "kbridge/client/codec.h"
#include "kbridge/client/config_loader.h"
#include "kbridge/client/errors.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using kbridge::client::ClientConfig;

namespace fs = std::filesystem;

namespace {

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

void test_defaults() {
    std::cout << "Testing ClientConfig defaults..." << std::endl;

    ClientConfig config;
    assert(config.scope() == "migrated-from-kafka");
    assert(config.client_id() == "default_readerId");
    assert(config.read_timeout() == std::chrono::milliseconds(100));
    assert(config.max_poll_records() == 500);
    assert(config.interceptor_classes().empty());
    assert(config.serializer()->name() == "string");
    assert(config.deserializer()->name() == "string");
    std::cout << "  ✓ Defaults applied" << std::endl;

    std::string first = config.group_id();
    std::string second = config.group_id();
    assert(first.size() == 36);
    assert(first[8] == '-' && first[13] == '-' && first[18] == '-' && first[23] == '-');
    assert(first != second);
    std::cout << "  ✓ Generated group id: " << first << std::endl;
}

void test_server_endpoints() {
    std::cout << "Testing server endpoint resolution..." << std::endl;

    ClientConfig config;
    assert(throws<kbridge::client::IllegalArgumentError>([&]() { config.server_endpoints(); }));
    assert(throws<kbridge::client::IllegalArgumentError>([&]() { config.server_endpoints("  "); }));
    assert(config.server_endpoints("tcp://fallback:9090") == "tcp://fallback:9090");
    std::cout << "  ✓ Missing endpoint needs a non-blank default" << std::endl;

    config.set(ClientConfig::BOOTSTRAP_SERVERS, "broker:9092");
    assert(config.server_endpoints() == "broker:9092");
    config.set(ClientConfig::CONTROLLER_URI, "controller:9090");
    assert(config.server_endpoints() == "controller:9090");
    std::cout << "  ✓ Controller URI preferred over bootstrap servers" << std::endl;
}

void test_typed_accessors() {
    std::cout << "Testing typed accessors..." << std::endl;

    ClientConfig config({
        {ClientConfig::READ_TIMEOUT_MS, "250"},
        {ClientConfig::MAX_POLL_RECORDS, " 42 "},
        {ClientConfig::INTERCEPTOR_CLASSES, "logging, counting,,"},
        {ClientConfig::VALUE_SERIALIZER, "org.apache.kafka.common.serialization.StringSerializer"},
        {ClientConfig::VALUE_DESERIALIZER, "envelope"},
        {ClientConfig::GROUP_ID, "analytics"},
    });
    assert(config.read_timeout() == std::chrono::milliseconds(250));
    assert(config.max_poll_records() == 42);
    auto names = config.interceptor_classes();
    assert(names.size() == 2);
    assert(names[0] == "logging" && names[1] == "counting");
    assert(config.serializer()->name() == "string");
    assert(config.deserializer()->name() == "envelope");
    assert(config.group_id() == "analytics");
    std::cout << "  ✓ Values parsed" << std::endl;

    config.set(ClientConfig::MAX_POLL_RECORDS, "0");
    assert(throws<kbridge::client::IllegalArgumentError>([&]() { config.max_poll_records(); }));
    config.set(ClientConfig::READ_TIMEOUT_MS, "10ms");
    assert(throws<kbridge::client::IllegalArgumentError>([&]() { config.read_timeout(); }));
    config.set(ClientConfig::VALUE_DESERIALIZER, "avro");
    assert(throws<kbridge::client::IllegalStateError>([&]() { config.deserializer(); }));
    std::cout << "  ✓ Invalid values rejected" << std::endl;
}

void test_string_codec_drops_key() {
    std::cout << "Testing string codec..." << std::endl;

    kbridge::client::StringCodec codec;
    std::string payload = codec.encode(std::string("key"), "value", {{"h", "v"}});
    assert(payload == "value");
    auto decoded = codec.decode(payload);
    assert(decoded.value == "value");
    assert(!decoded.key.has_value());
    assert(decoded.headers.empty());
    std::cout << "  ✓ Payload is the bare value" << std::endl;
}

void test_yaml_loading() {
    std::cout << "Testing YAML config loading..." << std::endl;

    std::string path = "test_client_config.yaml";
    {
        std::ofstream file(path);
        file << "bootstrap:\n"
             << "  servers: \"file://test_stream_data\"\n"
             << "group:\n"
             << "  id: dashboards\n"
             << "stream:\n"
             << "  scope: analytics\n"
             << "  read.timeout.ms: 20\n"
             << "max.poll.records: 64\n"
             << "interceptor.classes:\n"
             << "  - logging\n"
             << "  - counting\n"
             << "client.id:\n";
    }

    ClientConfig config = kbridge::client::load_client_config_from_yaml(path);
    assert(config.server_endpoints() == "file://test_stream_data");
    assert(config.group_id() == "dashboards");
    assert(config.scope() == "analytics");
    assert(config.read_timeout() == std::chrono::milliseconds(20));
    assert(config.max_poll_records() == 64);
    assert(config.interceptor_classes().size() == 2);
    assert(config.client_id() == "default_readerId");
    std::cout << "  ✓ Nested keys flattened, sequences joined" << std::endl;

    fs::remove(path);

    assert(throws<std::runtime_error>([]() {
        kbridge::client::load_client_config_from_yaml("does_not_exist.yaml");
    }));
    assert(throws<std::runtime_error>([]() {
        kbridge::client::load_client_config_from_yaml_string("- just\n- a list\n");
    }));
    std::cout << "  ✓ Missing file and non-mapping root rejected" << std::endl;
}

int main() {
    std::cout << "Running ClientConfig tests..." << std::endl;
    test_defaults();
    test_server_endpoints();
    test_typed_accessors();
    test_string_codec_drops_key();
    test_yaml_loading();
    std::cout << "\nAll ClientConfig tests passed!" << std::endl;
    return 0;
}
