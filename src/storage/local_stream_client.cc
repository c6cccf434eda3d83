/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: local_stream_client.cc
 * Description: Implementation of the in-process stream reader, writer and factory.
 */

#include "kbridge/storage/local_stream_client.h"
#include "kbridge/client/client_config.h"
#include "kbridge/client/errors.h"
#include <utility>

namespace kbridge {
namespace storage {

LocalStreamReader::LocalStreamReader(std::shared_ptr<StreamStore> store, std::string scope,
                                     std::string stream, std::string reader_group, std::string reader_id)
    : store_(std::move(store)),
      scope_(std::move(scope)),
      stream_(std::move(stream)),
      reader_group_(std::move(reader_group)),
      reader_id_(std::move(reader_id)) {
    store_->create_stream(scope_, stream_);
    generation_ = store_->join_reader_group(scope_, reader_group_, reader_id_);
}

client::EventRead LocalStreamReader::read_next_event(std::chrono::milliseconds timeout) {
    if (closed_.load()) {
        throw client::StreamError("Reader for stream " + stream_ + " is closed");
    }
    client::EventRead result;
    auto record = store_->read_next(scope_, stream_, reader_group_, generation_, timeout);
    if (record) {
        result.event = record->payload();
        result.position = record->position();
    }
    return result;
}

void LocalStreamReader::close() {
    closed_ = true;
}

LocalStreamWriter::LocalStreamWriter(std::shared_ptr<StreamStore> store, std::string scope, std::string stream)
    : store_(std::move(store)),
      scope_(std::move(scope)),
      stream_(std::move(stream)),
      writer_id_(client::generate_unique_id()),
      queue_("LocalStreamWriter[" + stream_ + "]",
             [this](const std::string& payload) {
                 store_->append(scope_, stream_, payload, writer_id_);
             }) {
}

LocalStreamWriter::~LocalStreamWriter() {
    queue_.stop();
}

void LocalStreamWriter::init() {
    store_->create_stream(scope_, stream_);
    queue_.start();
}

std::future<void> LocalStreamWriter::write_event(const std::string& payload) {
    return queue_.submit(payload);
}

void LocalStreamWriter::flush() {
    queue_.flush();
    store_->flush();
}

void LocalStreamWriter::close() {
    queue_.stop();
    store_->flush();
}

LocalStreamClientFactory::LocalStreamClientFactory(std::shared_ptr<StreamStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw client::IllegalArgumentError("LocalStreamClientFactory requires a store");
    }
}

std::shared_ptr<LocalStreamClientFactory> LocalStreamClientFactory::open(const std::string& directory) {
    StreamLog::Config config;
    config.base_dir = directory;
    return std::make_shared<LocalStreamClientFactory>(std::make_shared<StreamStore>(config));
}

std::unique_ptr<client::StreamReader> LocalStreamClientFactory::create_reader(const std::string& scope,
                                                                              const std::string& stream,
                                                                              const std::string& reader_group,
                                                                              const std::string& reader_id) {
    return std::make_unique<LocalStreamReader>(store_, scope, stream, reader_group, reader_id);
}

std::unique_ptr<client::StreamWriter> LocalStreamClientFactory::create_writer(const std::string& scope,
                                                                              const std::string& stream) {
    return std::make_unique<LocalStreamWriter>(store_, scope, stream);
}

} // namespace storage
} // namespace kbridge
