#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dispatch/cluster/v1/relay.pb.h"
#include "dispatch/services/v1/cluster_relay_service.grpc.pb.h"
#include "local_cluster_bus.hpp"

namespace dispatch::async {
class TaskWorker;
}

namespace dispatch::cluster {

struct GrpcClusterBusOptions {
  std::string              instance_id;
  std::vector<std::string> peers;
  uint32_t                 publish_timeout_ms = 1'000;
};

/*
  Bus spanning the configured peer processes.

  Publish delivers to local subscribers inline, then sends a BusEnvelope
  to every peer's ClusterRelay.Publish on the worker pool with a deadline.
  Peer failures are logged, never retried.
*/
class GrpcClusterBus final : public ClusterBus {
 public:
  GrpcClusterBus(GrpcClusterBusOptions options, std::shared_ptr<async::TaskWorker> worker);

  void Publish(const std::string& topic, const std::string& payload) override;
  void Subscribe(const std::string& topic, Handler handler) override;

  // Entry point for envelopes received from a peer. Own envelopes are dropped.
  void Deliver(const dispatch::cluster::v1::BusEnvelope& envelope);

  const std::string& InstanceId() const {
    return options_.instance_id;
  }

 private:
  struct Peer {
    std::string                                                  address;
    std::unique_ptr<dispatch::services::v1::ClusterRelay::Stub> stub;
  };

  GrpcClusterBusOptions              options_;
  std::shared_ptr<async::TaskWorker> worker_;
  LocalClusterBus                    local_;
  std::vector<std::shared_ptr<Peer>> peers_;
};

} // namespace dispatch::cluster
