#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace dispatch::grpc {

using namespace dispatch::services::v1;

AdminServer::AdminServer(std::shared_ptr<dispatch::service::AdminService> svc) : service_(std::move(svc)) {
}

// Operator surface: no caller identity is required.
::grpc::Status AdminServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  return Guarded([&] { *resp = service_->GetStats(*req); });
}

::grpc::Status AdminServer::BroadcastOrder(::grpc::ServerContext*, const BroadcastOrderRequest* req, google::protobuf::Empty*) {
  return Guarded([&] { service_->BroadcastOrder(*req); });
}

} // namespace dispatch::grpc
