#include "cluster_server.hpp"

#include "grpc_error.hpp"
#include "internal/cluster/grpc_cluster_bus.hpp"

namespace dispatch::grpc {

ClusterServer::ClusterServer(std::shared_ptr<dispatch::cluster::GrpcClusterBus> bus) : bus_(std::move(bus)) {
}

::grpc::Status ClusterServer::Publish(::grpc::ServerContext*, const dispatch::cluster::v1::BusEnvelope* req, google::protobuf::Empty*) {
  return Guarded([&] {
    if (req->topic().empty()) {
      throw util::InvalidInput("envelope topic is required");
    }
    bus_->Deliver(*req);
  });
}

} // namespace dispatch::grpc
