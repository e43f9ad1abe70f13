#include "realtime_server.hpp"

#include <cstddef>

#include "grpc_error.hpp"
#include "identity_metadata.hpp"
#include "internal/observability/logging.hpp"
#include "internal/realtime/queued_connection.hpp"
#include "internal/realtime/realtime_gateway.hpp"

namespace dispatch::grpc {

using dispatch::realtime::v1::ClientMessage;
using dispatch::realtime::v1::ServerMessage;
using Stream = ::grpc::ServerReaderWriter<ServerMessage, ClientMessage>;

namespace {

// Outbound frames queued per stream beyond which the client counts as stuck.
constexpr size_t kMaxQueuedFrames = 256;

} // namespace

RealtimeServer::RealtimeServer(std::shared_ptr<dispatch::realtime::RealtimeGateway> gateway, std::shared_ptr<auth::IdentityVerifier> verifier)
    : gateway_(std::move(gateway)), verifier_(std::move(verifier)) {
}

::grpc::Status RealtimeServer::Connect(::grpc::ServerContext* ctx, Stream* stream) {
  auth::Identity identity;
  try {
    identity = Authenticate(ctx->client_metadata(), *verifier_);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  // Close() may run on any thread; the writer is detached before the stream dies.
  auto connection = std::make_shared<dispatch::realtime::QueuedConnection>(
      [stream](const ServerMessage& message) { return stream->Write(message); }, [ctx] { ctx->TryCancel(); }, kMaxQueuedFrames);

  dispatch::realtime::ConnectionId id = 0;
  try {
    id = gateway_->Connect(identity, connection);

    ClientMessage message;
    while (stream->Read(&message)) {
      gateway_->HandleClientMessage(id, message);
    }
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("realtime stream failed", {observability::StringField("identity", identity.id), observability::StringField("error", e.what())});
    if (id != 0) {
      gateway_->Disconnect(id);
    }
    connection->Detach();
    return ToStatus(e);
  }

  gateway_->Disconnect(id);
  connection->Detach();

  if (ctx->IsCancelled()) {
    return ::grpc::Status::CANCELLED;
  }
  return ::grpc::Status::OK;
}

} // namespace dispatch::grpc
