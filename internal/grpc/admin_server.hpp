#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace dispatch::grpc {

// Operator surface; expected to be reachable only from the operator network.
class AdminServer final : public dispatch::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<dispatch::service::AdminService> svc);

  ::grpc::Status GetStats(::grpc::ServerContext*, const dispatch::services::v1::GetStatsRequest*, dispatch::services::v1::GetStatsResponse*) override;

  ::grpc::Status BroadcastOrder(::grpc::ServerContext*, const dispatch::services::v1::BroadcastOrderRequest*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<dispatch::service::AdminService> service_;
};

} // namespace dispatch::grpc
