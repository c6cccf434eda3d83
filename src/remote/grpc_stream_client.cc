/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: grpc_stream_client.cc
 * Description: Implementation of the gRPC stream reader, writer and factory.
 *              FAILED_PRECONDITION from ReadNext means the reader group was
 *              reset; DEADLINE_EXCEEDED is treated as "no data yet".
 */

#include "kbridge/remote/grpc_stream_client.h"
#include "kbridge/client/client_config.h"
#include "kbridge/client/errors.h"
#include <chrono>
#include <utility>

namespace kbridge {
namespace remote {

namespace {

// Slack on top of the server-side read timeout for the RPC deadline
constexpr auto RPC_DEADLINE_SLACK = std::chrono::seconds(5);
constexpr auto CALL_TIMEOUT = std::chrono::seconds(30);

void set_deadline(grpc::ClientContext& context, std::chrono::milliseconds timeout) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

[[noreturn]] void raise(const std::string& what, const grpc::Status& status) {
    throw client::StreamError(what + ": " + status.error_message() +
                              " (code " + std::to_string(static_cast<int>(status.error_code())) + ")");
}

void fill_ref(StreamRef* ref, const std::string& scope, const std::string& stream) {
    ref->set_scope(scope);
    ref->set_stream(stream);
}

} // namespace

GrpcStreamReader::GrpcStreamReader(StubPtr stub, std::string scope, std::string stream,
                                   std::string reader_group, std::string reader_id)
    : stub_(std::move(stub)),
      scope_(std::move(scope)),
      stream_(std::move(stream)),
      reader_group_(std::move(reader_group)),
      reader_id_(std::move(reader_id)) {
    JoinRequest request;
    fill_ref(request.mutable_stream(), scope_, stream_);
    request.set_reader_group(reader_group_);
    request.set_reader_id(reader_id_);

    JoinResponse response;
    grpc::ClientContext context;
    set_deadline(context, CALL_TIMEOUT);
    grpc::Status status = stub_->JoinReaderGroup(&context, request, &response);
    if (!status.ok()) {
        raise("Failed to join reader group " + reader_group_, status);
    }
    generation_ = response.generation();
}

client::EventRead GrpcStreamReader::read_next_event(std::chrono::milliseconds timeout) {
    if (closed_.load()) {
        throw client::StreamError("Reader for stream " + stream_ + " is closed");
    }

    ReadRequest request;
    fill_ref(request.mutable_stream(), scope_, stream_);
    request.set_reader_group(reader_group_);
    request.set_reader_id(reader_id_);
    request.set_generation(generation_);
    request.set_timeout_ms(timeout.count());

    ReadResponse response;
    grpc::ClientContext context;
    set_deadline(context, timeout + RPC_DEADLINE_SLACK);
    grpc::Status status = stub_->ReadNext(&context, request, &response);

    client::EventRead result;
    if (status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED) {
        return result;
    }
    if (status.error_code() == grpc::StatusCode::FAILED_PRECONDITION) {
        throw client::ReinitializationRequiredError(status.error_message());
    }
    if (!status.ok()) {
        raise("Failed to read from stream " + stream_, status);
    }
    if (response.has_event()) {
        result.event = response.record().payload();
        result.position = response.record().position();
    }
    return result;
}

void GrpcStreamReader::close() {
    closed_ = true;
}

GrpcStreamWriter::GrpcStreamWriter(StubPtr stub, std::string scope, std::string stream)
    : stub_(std::move(stub)),
      scope_(std::move(scope)),
      stream_(std::move(stream)),
      writer_id_(client::generate_unique_id()),
      queue_("GrpcStreamWriter[" + stream_ + "]",
             [this](const std::string& payload) { append(payload); }) {
}

GrpcStreamWriter::~GrpcStreamWriter() {
    queue_.stop();
}

void GrpcStreamWriter::init() {
    StreamRef request;
    fill_ref(&request, scope_, stream_);
    CreateStreamResponse response;
    grpc::ClientContext context;
    set_deadline(context, CALL_TIMEOUT);
    grpc::Status status = stub_->CreateStream(&context, request, &response);
    if (!status.ok()) {
        raise("Failed to create stream " + stream_, status);
    }
    queue_.start();
}

void GrpcStreamWriter::append(const std::string& payload) {
    AppendRequest request;
    fill_ref(request.mutable_stream(), scope_, stream_);
    request.set_payload(payload);
    request.set_writer_id(writer_id_);

    AppendResponse response;
    grpc::ClientContext context;
    set_deadline(context, CALL_TIMEOUT);
    grpc::Status status = stub_->Append(&context, request, &response);
    if (!status.ok()) {
        raise("Failed to append to stream " + stream_, status);
    }
}

std::future<void> GrpcStreamWriter::write_event(const std::string& payload) {
    return queue_.submit(payload);
}

void GrpcStreamWriter::flush() {
    queue_.flush();

    FlushRequest request;
    fill_ref(request.mutable_stream(), scope_, stream_);
    FlushResponse response;
    grpc::ClientContext context;
    set_deadline(context, CALL_TIMEOUT);
    grpc::Status status = stub_->Flush(&context, request, &response);
    if (!status.ok()) {
        raise("Failed to flush stream " + stream_, status);
    }
}

void GrpcStreamWriter::close() {
    queue_.stop();
}

GrpcStreamClientFactory::GrpcStreamClientFactory(const std::string& endpoint)
    : endpoint_(endpoint) {
    channel_ = grpc::CreateChannel(endpoint_, grpc::InsecureChannelCredentials());
    stub_ = std::shared_ptr<StreamStoreService::Stub>(StreamStoreService::NewStub(channel_));
}

std::unique_ptr<client::StreamReader> GrpcStreamClientFactory::create_reader(const std::string& scope,
                                                                             const std::string& stream,
                                                                             const std::string& reader_group,
                                                                             const std::string& reader_id) {
    return std::make_unique<GrpcStreamReader>(stub_, scope, stream, reader_group, reader_id);
}

std::unique_ptr<client::StreamWriter> GrpcStreamClientFactory::create_writer(const std::string& scope,
                                                                             const std::string& stream) {
    return std::make_unique<GrpcStreamWriter>(stub_, scope, stream);
}

int64_t GrpcStreamClientFactory::reset_reader_group(const std::string& scope, const std::string& reader_group) {
    ResetRequest request;
    request.set_scope(scope);
    request.set_reader_group(reader_group);
    ResetResponse response;
    grpc::ClientContext context;
    set_deadline(context, CALL_TIMEOUT);
    grpc::Status status = stub_->ResetReaderGroup(&context, request, &response);
    if (!status.ok()) {
        raise("Failed to reset reader group " + reader_group, status);
    }
    return response.generation();
}

} // namespace remote
} // namespace kbridge
