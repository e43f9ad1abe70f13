#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/realtime_service.grpc.pb.h"
#include "internal/auth/identity.hpp"

namespace dispatch::realtime {
class RealtimeGateway;
}

namespace dispatch::grpc {

/*
  Bidirectional stream transport for the realtime gateway.

  The stream is authenticated from its metadata before it is registered.
  Each inbound frame is handed to the gateway on the handler thread.
  Outbound frames are queued and written by a per-stream writer thread.
*/
class RealtimeServer final : public dispatch::services::v1::RealtimeService::Service {
 public:
  RealtimeServer(std::shared_ptr<dispatch::realtime::RealtimeGateway> gateway, std::shared_ptr<auth::IdentityVerifier> verifier);

  ::grpc::Status Connect(::grpc::ServerContext*,
                         ::grpc::ServerReaderWriter<dispatch::realtime::v1::ServerMessage, dispatch::realtime::v1::ClientMessage>*) override;

 private:
  std::shared_ptr<dispatch::realtime::RealtimeGateway> gateway_;
  std::shared_ptr<auth::IdentityVerifier>              verifier_;
};

} // namespace dispatch::grpc
