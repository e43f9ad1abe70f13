#include "grpc_cluster_bus.hpp"

#include <chrono>

#include <google/protobuf/empty.pb.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/async/task_worker.hpp"
#include "internal/observability/logging.hpp"

namespace dispatch::cluster {

using dispatch::observability::StringField;

GrpcClusterBus::GrpcClusterBus(GrpcClusterBusOptions options, std::shared_ptr<async::TaskWorker> worker)
    : options_(std::move(options)), worker_(std::move(worker)) {
  for (const auto& address : options_.peers) {
    auto peer     = std::make_shared<Peer>();
    peer->address = address;
    peer->stub    = dispatch::services::v1::ClusterRelay::NewStub(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials()));
    peers_.push_back(std::move(peer));
  }

  DISPATCH_LOG_INFO("cluster bus ready",
                    {StringField("instance_id", options_.instance_id), observability::IntField("peers", static_cast<int64_t>(peers_.size()))});
}

void GrpcClusterBus::Publish(const std::string& topic, const std::string& payload) {
  local_.Publish(topic, payload);

  if (peers_.empty()) return;

  dispatch::cluster::v1::BusEnvelope envelope;
  envelope.set_topic(topic);
  envelope.set_origin(options_.instance_id);
  envelope.set_payload(payload);

  const auto timeout = std::chrono::milliseconds(options_.publish_timeout_ms);
  for (const auto& peer : peers_) {
    try {
      worker_->Submit([peer, envelope, timeout] {
        ::grpc::ClientContext ctx;
        ctx.set_deadline(std::chrono::system_clock::now() + timeout);

        google::protobuf::Empty resp;
        const auto              status = peer->stub->Publish(&ctx, envelope, &resp);
        if (!status.ok()) {
          DISPATCH_LOG_WARN("cluster publish failed", {StringField("peer", peer->address), StringField("topic", envelope.topic()),
                                                       StringField("error", status.error_message())});
        }
      });
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("cluster publish dropped", {StringField("peer", peer->address), StringField("error", e.what())});
    }
  }
}

void GrpcClusterBus::Subscribe(const std::string& topic, Handler handler) {
  local_.Subscribe(topic, std::move(handler));
}

void GrpcClusterBus::Deliver(const dispatch::cluster::v1::BusEnvelope& envelope) {
  if (envelope.origin() == options_.instance_id) return;
  local_.Publish(envelope.topic(), envelope.payload());
}

} // namespace dispatch::cluster
