/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: kbridge_streamd.cc
 * Description: Stream store daemon. Serves a file-backed StreamStore over gRPC so
 *              that consumers and producers configured with a host:port endpoint
 *              can share streams across processes.
 */

#include "kbridge/remote/stream_service.h"
#include "kbridge/storage/stream_store.h"
#include <atomic>
#include <iostream>
#include <signal.h>
#include <memory>
#include <thread>
#include <chrono>

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/) {
    g_running = false;
}

int main(int argc, char** argv) {
    std::string listen_address = "0.0.0.0:50051";
    std::string data_dir = "stream_data";

    if (argc > 1) {
        listen_address = argv[1];
    }
    if (argc > 2) {
        data_dir = argv[2];
    }

    std::cout << "kbridge Stream Store Daemon" << std::endl;
    std::cout << "Listening on: " << listen_address << std::endl;
    std::cout << "Data directory: " << data_dir << std::endl;

    std::shared_ptr<kbridge::storage::StreamStore> store;
    try {
        kbridge::storage::StreamLog::Config store_config;
        store_config.base_dir = data_dir;
        store = std::make_shared<kbridge::storage::StreamStore>(store_config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open stream store: " << e.what() << std::endl;
        return 1;
    }

    kbridge::remote::GrpcStreamService service(listen_address, store);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (!service.start()) {
        std::cerr << "Failed to start gRPC service" << std::endl;
        return 1;
    }

    std::cout << "Stream store daemon running. Press Ctrl+C to stop." << std::endl;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    service.stop();
    std::cout << "Stream store daemon stopped" << std::endl;
    return 0;
}
