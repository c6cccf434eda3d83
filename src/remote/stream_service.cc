/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: stream_service.cc
 * Description: Implementation of the gRPC stream store service. Store faults map
 *              to gRPC status codes; a stale reader generation is reported as
 *              FAILED_PRECONDITION.
 */

#include "kbridge/remote/stream_service.h"
#include "kbridge/client/errors.h"
#include <chrono>
#include <iostream>
#include <utility>

namespace kbridge {
namespace remote {

namespace {

// Upper bound on a single server-side blocking read
constexpr int64_t MAX_READ_TIMEOUT_MS = 30000;

grpc::Status to_status(const std::exception& e) {
    if (dynamic_cast<const client::ReinitializationRequiredError*>(&e)) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
    }
    if (dynamic_cast<const client::IllegalArgumentError*>(&e)) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
}

} // namespace

GrpcStreamService::GrpcStreamService(const std::string& listen_address,
                                     std::shared_ptr<storage::StreamStore> store)
    : listen_address_(listen_address), store_(std::move(store)) {
}

GrpcStreamService::~GrpcStreamService() {
    stop();
}

bool GrpcStreamService::start() {
    if (running_.exchange(true)) {
        return false; // Already running
    }

    grpc::ServerBuilder builder;
    builder.AddListeningPort(listen_address_, grpc::InsecureServerCredentials());
    builder.RegisterService(this);

    server_ = builder.BuildAndStart();
    if (!server_) {
        running_ = false;
        std::cerr << "GrpcStreamService: Failed to listen on " << listen_address_ << std::endl;
        return false;
    }

    server_thread_ = std::thread([this]() {
        server_->Wait();
    });

    std::cout << "GrpcStreamService: listening on " << listen_address_ << std::endl;
    return true;
}

void GrpcStreamService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (server_) {
        server_->Shutdown();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    store_->flush();
}

grpc::Status GrpcStreamService::CreateStream(grpc::ServerContext* /*context*/, const StreamRef* request,
                                             CreateStreamResponse* response) {
    try {
        response->set_created(store_->create_stream(request->scope(), request->stream()));
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return to_status(e);
    }
}

grpc::Status GrpcStreamService::Append(grpc::ServerContext* /*context*/, const AppendRequest* request,
                                       AppendResponse* response) {
    try {
        response->set_position(store_->append(request->stream().scope(), request->stream().stream(),
                                              request->payload(), request->writer_id()));
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return to_status(e);
    }
}

grpc::Status GrpcStreamService::Flush(grpc::ServerContext* /*context*/, const FlushRequest* /*request*/,
                                      FlushResponse* /*response*/) {
    try {
        store_->flush();
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return to_status(e);
    }
}

grpc::Status GrpcStreamService::JoinReaderGroup(grpc::ServerContext* /*context*/, const JoinRequest* request,
                                                JoinResponse* response) {
    try {
        store_->create_stream(request->stream().scope(), request->stream().stream());
        response->set_generation(store_->join_reader_group(request->stream().scope(),
                                                           request->reader_group(),
                                                           request->reader_id()));
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return to_status(e);
    }
}

grpc::Status GrpcStreamService::ReadNext(grpc::ServerContext* /*context*/, const ReadRequest* request,
                                         ReadResponse* response) {
    int64_t timeout_ms = request->timeout_ms();
    if (timeout_ms < 0) {
        timeout_ms = 0;
    } else if (timeout_ms > MAX_READ_TIMEOUT_MS) {
        timeout_ms = MAX_READ_TIMEOUT_MS;
    }

    try {
        auto record = store_->read_next(request->stream().scope(), request->stream().stream(),
                                        request->reader_group(), request->generation(),
                                        std::chrono::milliseconds(timeout_ms));
        response->set_has_event(record.has_value());
        if (record) {
            *response->mutable_record() = std::move(*record);
        }
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return to_status(e);
    }
}

grpc::Status GrpcStreamService::ResetReaderGroup(grpc::ServerContext* /*context*/, const ResetRequest* request,
                                                 ResetResponse* response) {
    try {
        response->set_generation(store_->reset_reader_group(request->scope(), request->reader_group()));
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return to_status(e);
    }
}

} // namespace remote
} // namespace kbridge
