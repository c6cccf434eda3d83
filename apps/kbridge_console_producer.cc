/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: kbridge_console_producer.cc
 * Description: Console producer. Reads lines from stdin and sends each one as a
 *              record to the given topic. A line of the form key<TAB>value is
 *              sent with a key.
 */

#include "kbridge/client/config_loader.h"
#include "kbridge/producer/stream_producer.h"
#include "kbridge/remote/connect.h"
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <topic>" << std::endl;
        return 1;
    }
    std::string config_file = argv[1];
    std::string topic = argv[2];

    std::cout << "kbridge Console Producer" << std::endl;
    std::cout << "Config: " << config_file << std::endl;
    std::cout << "Topic: " << topic << std::endl;

    std::unique_ptr<kbridge::producer::StreamProducer> producer;
    try {
        kbridge::client::ClientConfig config = kbridge::client::load_client_config_from_yaml(config_file);
        producer = std::make_unique<kbridge::producer::StreamProducer>(config, kbridge::remote::connect(config));
    } catch (const std::exception& e) {
        std::cerr << "Failed to create producer: " << e.what() << std::endl;
        return 1;
    }

    std::atomic<int> failed{0};
    int sent = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        kbridge::producer::ProducerRecord record(topic, line);
        auto tab = line.find('\t');
        if (tab != std::string::npos) {
            record = kbridge::producer::ProducerRecord(topic, line.substr(0, tab), line.substr(tab + 1));
        }

        try {
            producer->send(record, [&failed](const std::optional<kbridge::producer::RecordMetadata>& /*metadata*/,
                                             std::exception_ptr error) {
                if (error) {
                    failed++;
                }
            });
            sent++;
        } catch (const std::exception& e) {
            std::cerr << "Failed to send record: " << e.what() << std::endl;
            failed++;
        }
    }

    producer->flush();
    producer->close();

    std::cout << "Sent " << sent << " records (" << failed.load() << " failed)" << std::endl;
    return failed.load() == 0 ? 0 : 2;
}
