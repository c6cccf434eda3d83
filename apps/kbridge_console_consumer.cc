/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: kbridge_console_consumer.cc
 * Description: Console consumer. Subscribes to one or more comma separated
 *              topics and polls until interrupted, emitting every record to
 *              stdout as JSON and optionally to a JSONL file.
 */

#include "kbridge/client/config_loader.h"
#include "kbridge/client/errors.h"
#include "kbridge/consumer/stream_consumer.h"
#include "kbridge/remote/connect.h"
#include "kbridge/sinks/jsonl_sink.h"
#include "kbridge/sinks/stdout_sink.h"
#include <atomic>
#include <iostream>
#include <signal.h>
#include <memory>
#include <sstream>
#include <vector>

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/) {
    g_running = false;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <topic>[,topic...] [jsonl_out]" << std::endl;
        return 1;
    }
    std::string config_file = argv[1];
    std::vector<std::string> topics;
    std::stringstream topic_list(argv[2]);
    std::string topic;
    while (std::getline(topic_list, topic, ',')) {
        if (!topic.empty()) {
            topics.push_back(topic);
        }
    }

    std::cout << "kbridge Console Consumer" << std::endl;
    std::cout << "Config: " << config_file << std::endl;
    std::cout << "Topics: " << argv[2] << std::endl;

    std::unique_ptr<kbridge::consumer::StreamConsumer> consumer;
    try {
        kbridge::client::ClientConfig config = kbridge::client::load_client_config_from_yaml(config_file);
        consumer = std::make_unique<kbridge::consumer::StreamConsumer>(config, kbridge::remote::connect(config));
        consumer->subscribe(topics);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create consumer: " << e.what() << std::endl;
        return 1;
    }

    std::vector<std::shared_ptr<kbridge::sinks::RecordSink>> sinks;
    sinks.push_back(std::make_shared<kbridge::sinks::StdoutSink>());
    if (argc > 3) {
        auto jsonl_sink = std::make_shared<kbridge::sinks::JSONLSink>(argv[3]);
        if (!jsonl_sink->is_open()) {
            return 1;
        }
        sinks.push_back(jsonl_sink);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "Consumer running (reader group " << consumer->reader_group_id() << ")..." << std::endl;

    int exit_code = 0;
    size_t total = 0;
    bool resubscribe = false;
    while (g_running) {
        try {
            if (resubscribe) {
                consumer->subscribe(topics);
                resubscribe = false;
            }
            auto records = consumer->poll(std::chrono::milliseconds(1000));
            for (auto& sink : sinks) {
                sink->emit_batch(records);
            }
            total += records.count();
        } catch (const kbridge::client::ReinitializationRequiredError& e) {
            // The reader group was reset; start over with fresh readers
            std::cerr << "Reader group reset, resubscribing: " << e.what() << std::endl;
            resubscribe = true;
        } catch (const std::exception& e) {
            std::cerr << "Poll failed: " << e.what() << std::endl;
            exit_code = 1;
            break;
        }
    }

    for (auto& sink : sinks) {
        sink->flush();
        sink->close();
    }
    consumer->close();

    std::cout << "Consumed " << total << " records" << std::endl;
    return exit_code;
}
