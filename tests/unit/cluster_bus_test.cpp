#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/async/task_worker.hpp"
#include "internal/cluster/grpc_cluster_bus.hpp"
#include "internal/cluster/local_cluster_bus.hpp"
#include "internal/grpc/cluster_server.hpp"

namespace {

using namespace dispatch;

class Inbox {
 public:
  cluster::Handler Handler() {
    return [this](const std::string& payload) {
      std::lock_guard lock(mutex_);
      payloads_.push_back(payload);
    };
  }

  std::vector<std::string> Payloads() {
    std::lock_guard lock(mutex_);
    return payloads_;
  }

  bool WaitFor(size_t count, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (Payloads().size() >= count) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return Payloads().size() >= count;
  }

 private:
  std::mutex               mutex_;
  std::vector<std::string> payloads_;
};

dispatch::cluster::v1::BusEnvelope Envelope(const std::string& topic, const std::string& origin, const std::string& payload) {
  dispatch::cluster::v1::BusEnvelope envelope;
  envelope.set_topic(topic);
  envelope.set_origin(origin);
  envelope.set_payload(payload);
  return envelope;
}

void TestLocalBusDeliversPerTopic() {
  cluster::LocalClusterBus bus;
  Inbox                    relay;
  Inbox                    relay_too;
  Inbox                    location;
  bus.Subscribe(cluster::kRelayTopic, relay.Handler());
  bus.Subscribe(cluster::kRelayTopic, relay_too.Handler());
  bus.Subscribe(cluster::kDriverLocationTopic, location.Handler());

  bus.Publish(cluster::kRelayTopic, "first");
  bus.Publish(cluster::kRelayTopic, "second");
  bus.Publish("nobody.listens", "ignored");

  assert(relay.Payloads() == (std::vector<std::string>{"first", "second"}));
  assert(relay_too.Payloads().size() == 2);
  assert(location.Payloads().empty());
}

void TestThrowingHandlerIsSkipped() {
  cluster::LocalClusterBus bus;
  Inbox                    after;
  bus.Subscribe(cluster::kBroadcastTopic, [](const std::string&) { throw std::runtime_error("handler exploded"); });
  bus.Subscribe(cluster::kBroadcastTopic, after.Handler());

  bus.Publish(cluster::kBroadcastTopic, "payload");
  assert(after.Payloads().size() == 1);
}

void TestDeliverDropsOwnEnvelopes() {
  auto worker = std::make_shared<async::TaskWorker>("bus-test", 1);
  worker->Start();

  cluster::GrpcClusterBus bus({"node-a", {}, 1'000}, worker);
  Inbox                   inbox;
  bus.Subscribe(cluster::kRelayTopic, inbox.Handler());

  bus.Deliver(Envelope(cluster::kRelayTopic, "node-a", "echo"));
  assert(inbox.Payloads().empty());

  bus.Deliver(Envelope(cluster::kRelayTopic, "node-b", "from-b"));
  assert(inbox.Payloads().size() == 1);
  assert(inbox.Payloads()[0] == "from-b");

  // without peers Publish is purely local
  bus.Publish(cluster::kRelayTopic, "local");
  assert(inbox.Payloads().size() == 2);

  worker->Stop();
}

void TestPeersReceiveOverGrpc() {
  auto worker = std::make_shared<async::TaskWorker>("bus-test", 2);
  worker->Start();

  auto  receiver = std::make_shared<cluster::GrpcClusterBus>(cluster::GrpcClusterBusOptions{"node-b", {}, 1'000}, worker);
  Inbox received;
  receiver->Subscribe(cluster::kDriverLocationTopic, received.Handler());

  dispatch::grpc::ClusterServer service(receiver);
  int                   port = 0;
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort("127.0.0.1:0", ::grpc::InsecureServerCredentials(), &port);
  builder.RegisterService(&service);
  auto server = builder.BuildAndStart();
  assert(server);
  assert(port > 0);

  cluster::GrpcClusterBus sender({"node-a", {"127.0.0.1:" + std::to_string(port), "127.0.0.1:1"}, 1'000}, worker);
  Inbox                   local;
  sender.Subscribe(cluster::kDriverLocationTopic, local.Handler());

  // the unreachable second peer must not block or throw
  sender.Publish(cluster::kDriverLocationTopic, "position");
  assert(local.Payloads().size() == 1);
  assert(received.WaitFor(1, std::chrono::seconds(5)));
  assert(received.Payloads()[0] == "position");

  // an empty topic is refused at the receiving end
  auto                      stub = dispatch::services::v1::ClusterRelay::NewStub(
      ::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), ::grpc::InsecureChannelCredentials()));
  ::grpc::ClientContext     ctx;
  google::protobuf::Empty   resp;
  const auto                status = stub->Publish(&ctx, Envelope("", "node-c", "x"), &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
  worker->Stop();
}

} // namespace

int main() {
  TestLocalBusDeliversPerTopic();
  TestThrowingHandlerIsSkipped();
  TestDeliverDropsOwnEnvelopes();
  TestPeersReceiveOverGrpc();
  std::cout << "cluster_bus_test: pass\n";
  return 0;
}
