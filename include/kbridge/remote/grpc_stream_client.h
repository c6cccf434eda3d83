/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: grpc_stream_client.h
 * Description: Stream handles talking to a remote stream store (kbridge_streamd)
 *              over gRPC.
 */

#pragma once

#include "kbridge/client/async_write_queue.h"
#include "kbridge/client/stream_handle.h"
#include "stream_service.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <memory>
#include <string>

namespace kbridge {
namespace remote {

using StubPtr = std::shared_ptr<StreamStoreService::Stub>;

class GrpcStreamReader : public client::StreamReader {
public:
    GrpcStreamReader(StubPtr stub, std::string scope, std::string stream,
                     std::string reader_group, std::string reader_id);

    client::EventRead read_next_event(std::chrono::milliseconds timeout) override;
    void close() override;

    const std::string& stream() const override { return stream_; }
    const std::string& reader_group() const override { return reader_group_; }

private:
    StubPtr stub_;
    std::string scope_;
    std::string stream_;
    std::string reader_group_;
    std::string reader_id_;
    int64_t generation_ = 0;
    std::atomic<bool> closed_{false};
};

class GrpcStreamWriter : public client::StreamWriter {
public:
    GrpcStreamWriter(StubPtr stub, std::string scope, std::string stream);
    ~GrpcStreamWriter() override;

    void init() override;
    std::future<void> write_event(const std::string& payload) override;
    void flush() override;
    void close() override;

    const std::string& stream() const override { return stream_; }

private:
    StubPtr stub_;
    std::string scope_;
    std::string stream_;
    std::string writer_id_;
    client::AsyncWriteQueue queue_;

    void append(const std::string& payload);
};

class GrpcStreamClientFactory : public client::StreamClientFactory {
public:
    // endpoint is host:port of a kbridge_streamd instance
    explicit GrpcStreamClientFactory(const std::string& endpoint);

    std::unique_ptr<client::StreamReader> create_reader(const std::string& scope,
                                                        const std::string& stream,
                                                        const std::string& reader_group,
                                                        const std::string& reader_id) override;

    std::unique_ptr<client::StreamWriter> create_writer(const std::string& scope,
                                                        const std::string& stream) override;

    // Rewind a reader group; readers that joined earlier must be recreated
    int64_t reset_reader_group(const std::string& scope, const std::string& reader_group);

private:
    std::string endpoint_;
    std::shared_ptr<grpc::Channel> channel_;
    StubPtr stub_;
};

} // namespace remote
} // namespace kbridge
