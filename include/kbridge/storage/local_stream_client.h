/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: local_stream_client.h
 * Description: In-process stream handles over a shared StreamStore. Used for
 *              "file://" endpoints and by the store daemon's tests.
 */

#pragma once

#include "kbridge/client/async_write_queue.h"
#include "kbridge/client/stream_handle.h"
#include "kbridge/storage/stream_store.h"
#include <atomic>
#include <memory>
#include <string>

namespace kbridge {
namespace storage {

class LocalStreamReader : public client::StreamReader {
public:
    LocalStreamReader(std::shared_ptr<StreamStore> store, std::string scope, std::string stream,
                      std::string reader_group, std::string reader_id);

    client::EventRead read_next_event(std::chrono::milliseconds timeout) override;
    void close() override;

    const std::string& stream() const override { return stream_; }
    const std::string& reader_group() const override { return reader_group_; }
    const std::string& reader_id() const { return reader_id_; }

private:
    std::shared_ptr<StreamStore> store_;
    std::string scope_;
    std::string stream_;
    std::string reader_group_;
    std::string reader_id_;
    int64_t generation_;
    std::atomic<bool> closed_{false};
};

class LocalStreamWriter : public client::StreamWriter {
public:
    LocalStreamWriter(std::shared_ptr<StreamStore> store, std::string scope, std::string stream);
    ~LocalStreamWriter() override;

    // Creates the stream if needed and starts the append worker
    void init() override;
    std::future<void> write_event(const std::string& payload) override;
    void flush() override;
    void close() override;

    const std::string& stream() const override { return stream_; }

private:
    std::shared_ptr<StreamStore> store_;
    std::string scope_;
    std::string stream_;
    std::string writer_id_;
    client::AsyncWriteQueue queue_;
};

class LocalStreamClientFactory : public client::StreamClientFactory {
public:
    explicit LocalStreamClientFactory(std::shared_ptr<StreamStore> store);

    // Opens a store rooted at directory
    static std::shared_ptr<LocalStreamClientFactory> open(const std::string& directory);

    std::unique_ptr<client::StreamReader> create_reader(const std::string& scope,
                                                        const std::string& stream,
                                                        const std::string& reader_group,
                                                        const std::string& reader_id) override;

    std::unique_ptr<client::StreamWriter> create_writer(const std::string& scope,
                                                        const std::string& stream) override;

    std::shared_ptr<StreamStore> store() const { return store_; }

private:
    std::shared_ptr<StreamStore> store_;
};

} // namespace storage
} // namespace kbridge
