/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_service.h
 * Description: Header for GrpcStreamService, which serves a StreamStore over the
 *              StreamStoreService RPCs. The server runs on its own thread
 *              between start() and stop().
 */

#pragma once

#include "kbridge/storage/stream_store.h"
#include "stream_service.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace kbridge {
namespace remote {

class GrpcStreamService : public StreamStoreService::Service {
public:
    GrpcStreamService(const std::string& listen_address, std::shared_ptr<storage::StreamStore> store);
    ~GrpcStreamService();

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    grpc::Status CreateStream(grpc::ServerContext* context, const StreamRef* request,
                              CreateStreamResponse* response) override;
    grpc::Status Append(grpc::ServerContext* context, const AppendRequest* request,
                        AppendResponse* response) override;
    grpc::Status Flush(grpc::ServerContext* context, const FlushRequest* request,
                       FlushResponse* response) override;
    grpc::Status JoinReaderGroup(grpc::ServerContext* context, const JoinRequest* request,
                                 JoinResponse* response) override;
    grpc::Status ReadNext(grpc::ServerContext* context, const ReadRequest* request,
                          ReadResponse* response) override;
    grpc::Status ResetReaderGroup(grpc::ServerContext* context, const ResetRequest* request,
                                  ResetResponse* response) override;

private:
    std::string listen_address_;
    std::shared_ptr<storage::StreamStore> store_;
    std::unique_ptr<grpc::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
};

} // namespace remote
} // namespace kbridge
