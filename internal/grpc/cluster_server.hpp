#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/cluster_relay_service.grpc.pb.h"

namespace dispatch::cluster {
class GrpcClusterBus;
}

namespace dispatch::grpc {

// Receiving end of the peer-to-peer cluster bus.
class ClusterServer final : public dispatch::services::v1::ClusterRelay::Service {
 public:
  explicit ClusterServer(std::shared_ptr<dispatch::cluster::GrpcClusterBus> bus);

  ::grpc::Status Publish(::grpc::ServerContext*, const dispatch::cluster::v1::BusEnvelope*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<dispatch::cluster::GrpcClusterBus> bus_;
};

} // namespace dispatch::grpc
