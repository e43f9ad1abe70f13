#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/async/task_worker.hpp"
#include "internal/cluster/local_cluster_bus.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/geo/memory_geo_backend.hpp"
#include "internal/realtime/queued_connection.hpp"
#include "internal/realtime/realtime_gateway.hpp"
#include "internal/realtime/realtime_notification_sink.hpp"

namespace {

using namespace dispatch;
using dispatch::realtime::v1::ClientMessage;
using dispatch::realtime::v1::ServerMessage;

class FakeConnection final : public realtime::Connection {
 public:
  bool Send(const ServerMessage& message) override {
    std::lock_guard lock(mutex_);
    if (!alive_) return false;
    received_.push_back(message);
    return true;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    ++closes_;
  }

  void Kill() {
    std::lock_guard lock(mutex_);
    alive_ = false;
  }

  std::vector<ServerMessage> Received() {
    std::lock_guard lock(mutex_);
    return received_;
  }

  size_t Count(ServerMessage::PayloadCase kind) {
    std::lock_guard lock(mutex_);
    size_t          n = 0;
    for (const auto& m : received_) {
      if (m.payload_case() == kind) ++n;
    }
    return n;
  }

  int Closes() {
    std::lock_guard lock(mutex_);
    return closes_;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    received_.clear();
  }

 private:
  std::mutex                 mutex_;
  std::vector<ServerMessage> received_;
  bool                       alive_  = true;
  int                        closes_ = 0;
};

auth::Identity Rider(const std::string& id) {
  return {id, auth::Role::kRider};
}

auth::Identity Driver(const std::string& id) {
  return {id, auth::Role::kDriver};
}

std::shared_ptr<realtime::RealtimeGateway> MakeGateway(std::shared_ptr<cluster::ClusterBus> bus, const std::string& instance_id,
                                                       std::shared_ptr<geo::GeoIndex> geo = nullptr) {
  realtime::GatewayOptions options;
  options.instance_id         = instance_id;
  options.liveness_timeout_ms = 1'000;
  auto gateway                = std::make_shared<realtime::RealtimeGateway>(options, std::move(bus), std::move(geo));
  gateway->Start();
  return gateway;
}

ServerMessage LocationMessage(const std::string& order_id) {
  ServerMessage message;
  auto*         location = message.mutable_driver_location();
  location->set_driver_id("drv-1");
  location->set_latitude(28.6139);
  location->set_longitude(77.2090);
  location->set_order_id(order_id);
  return message;
}

void TestConnectSendsConnected() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto conn    = std::make_shared<FakeConnection>();

  gateway->Connect(Rider("rider-1"), conn);

  const auto received = conn->Received();
  assert(received.size() == 1);
  assert(received[0].has_connected());
  assert(received[0].connected().identity() == "rider-1");
  assert(received[0].connected().role() == "rider");
  assert(received[0].connected().instance_id() == "node-a");
  assert(received[0].has_timestamp());
  assert(received[0].timestamp().seconds() > 0);

  const auto stats = gateway->Stats();
  assert(stats.connections == 1);
  assert(stats.riders == 1);
  assert(stats.drivers == 0);
}

void TestReconnectReplacesOldConnection() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto first   = std::make_shared<FakeConnection>();
  auto second  = std::make_shared<FakeConnection>();

  const auto first_id  = gateway->Connect(Driver("drv-1"), first);
  const auto second_id = gateway->Connect(Driver("drv-1"), second);
  assert(first_id != second_id);
  assert(first->Closes() == 1);
  assert(gateway->Stats().connections == 1);

  // the replaced stream ending later must not unregister the new one
  gateway->Disconnect(first_id);
  assert(gateway->Stats().connections == 1);

  assert(gateway->SendTo("drv-1", LocationMessage("")));
  assert(second->Count(ServerMessage::kDriverLocation) == 1);
  assert(first->Count(ServerMessage::kDriverLocation) == 0);

  gateway->Disconnect(second_id);
  assert(gateway->Stats().connections == 0);
}

void TestChannelBroadcastReachesSubscribersOnly() {
  auto gateway    = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto subscriber = std::make_shared<FakeConnection>();
  auto bystander  = std::make_shared<FakeConnection>();

  const auto id = gateway->Connect(Rider("rider-1"), subscriber);
  gateway->Connect(Rider("rider-2"), bystander);

  ClientMessage subscribe;
  subscribe.mutable_subscribe()->set_channel(realtime::OrderChannel("o-1"));
  gateway->HandleClientMessage(id, subscribe);
  assert(subscriber->Count(ServerMessage::kSubscribed) == 1);
  assert(subscriber->Received().back().subscribed().channel() == "order:o-1");

  gateway->Broadcast(realtime::OrderChannel("o-1"), LocationMessage("o-1"));
  assert(subscriber->Count(ServerMessage::kDriverLocation) == 1);
  assert(bystander->Count(ServerMessage::kDriverLocation) == 0);

  ClientMessage unsubscribe;
  unsubscribe.mutable_unsubscribe()->set_channel("order:o-1");
  gateway->HandleClientMessage(id, unsubscribe);
  gateway->Broadcast(realtime::OrderChannel("o-1"), LocationMessage("o-1"));
  assert(subscriber->Count(ServerMessage::kDriverLocation) == 1);
}

void TestBroadcastToRole() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto rider   = std::make_shared<FakeConnection>();
  auto driver  = std::make_shared<FakeConnection>();
  gateway->Connect(Rider("rider-1"), rider);
  gateway->Connect(Driver("drv-1"), driver);

  ServerMessage message;
  message.mutable_heartbeat();
  gateway->BroadcastToRole(auth::Role::kDriver, message);

  assert(driver->Count(ServerMessage::kHeartbeat) == 1);
  assert(rider->Count(ServerMessage::kHeartbeat) == 0);
}

void TestBroadcastToRoleSkipsExcludedIdentities() {
  auto bus    = std::make_shared<cluster::LocalClusterBus>();
  auto node_a = MakeGateway(bus, "node-a");
  auto node_b = MakeGateway(bus, "node-b");

  auto excluded_a = std::make_shared<FakeConnection>();
  auto kept_a     = std::make_shared<FakeConnection>();
  auto excluded_b = std::make_shared<FakeConnection>();
  auto kept_b     = std::make_shared<FakeConnection>();
  node_a->Connect(Driver("drv-1"), excluded_a);
  node_a->Connect(Driver("drv-2"), kept_a);
  node_b->Connect(Driver("drv-3"), excluded_b);
  node_b->Connect(Driver("drv-4"), kept_b);

  ServerMessage message;
  message.mutable_heartbeat();
  node_a->BroadcastToRole(auth::Role::kDriver, message, {"drv-1", "drv-3"});

  assert(excluded_a->Count(ServerMessage::kHeartbeat) == 0);
  assert(excluded_b->Count(ServerMessage::kHeartbeat) == 0);
  assert(kept_a->Count(ServerMessage::kHeartbeat) == 1);
  assert(kept_b->Count(ServerMessage::kHeartbeat) == 1);
}

void TestQueuedConnectionDoesNotBlockSender() {
  std::promise<void> gate;
  auto               opened = gate.get_future().share();
  std::atomic<int>   written{0};

  realtime::QueuedConnection conn(
      [&](const ServerMessage&) {
        opened.wait();
        ++written;
        return true;
      },
      [] {}, 16);

  // the writer is stuck on the first frame, yet both sends return at once
  assert(conn.Send(LocationMessage("o-1")));
  assert(conn.Send(LocationMessage("o-2")));
  assert(written.load() == 0);

  gate.set_value();
  for (int i = 0; i < 200 && written.load() < 2; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(written.load() == 2);
  conn.Detach();
  assert(!conn.Send(LocationMessage("o-3")));
}

void TestQueuedConnectionClosesStuckClient() {
  std::promise<void> gate;
  auto               opened = gate.get_future().share();
  std::atomic<int>   cancels{0};

  realtime::QueuedConnection conn(
      [&](const ServerMessage&) {
        opened.wait();
        return true;
      },
      [&] { ++cancels; }, 2);

  bool rejected = false;
  for (int i = 0; i < 10 && !rejected; ++i) {
    rejected = !conn.Send(LocationMessage("o-1"));
  }
  assert(rejected);
  assert(cancels.load() == 1);

  // closed for good; a second close does not cancel again
  assert(!conn.Send(LocationMessage("o-2")));
  conn.Close();
  assert(cancels.load() == 1);

  gate.set_value();
  conn.Detach();
}

void TestQueuedConnectionStopsAfterFailedWrite() {
  std::atomic<int> attempts{0};
  realtime::QueuedConnection conn(
      [&](const ServerMessage&) {
        ++attempts;
        return false;
      },
      [] {}, 16);

  assert(conn.Send(LocationMessage("o-1")));
  for (int i = 0; i < 200 && attempts.load() == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  for (int i = 0; i < 200 && conn.Send(LocationMessage("o-2")); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(!conn.Send(LocationMessage("o-3")));
  conn.Detach();
  assert(attempts.load() == 1);
}

void TestSendToRelaysAcrossProcesses() {
  // two gateways on one bus stand in for two processes
  auto bus    = std::make_shared<cluster::LocalClusterBus>();
  auto node_a = MakeGateway(bus, "node-a");
  auto node_b = MakeGateway(bus, "node-b");

  auto rider_on_b = std::make_shared<FakeConnection>();
  auto other_on_b = std::make_shared<FakeConnection>();
  node_b->Connect(Rider("rider-9"), rider_on_b);
  const auto other_id = node_b->Connect(Rider("rider-10"), other_on_b);

  // not local to node-a: false, but still delivered through node-b
  assert(!node_a->SendTo("rider-9", LocationMessage("o-7")));
  assert(rider_on_b->Count(ServerMessage::kDriverLocation) == 1);
  assert(rider_on_b->Received().back().driver_location().order_id() == "o-7");
  assert(rider_on_b->Received().back().has_timestamp());

  // channel broadcasts cross processes as well
  ClientMessage subscribe;
  subscribe.mutable_subscribe()->set_channel("order:o-7");
  node_b->HandleClientMessage(other_id, subscribe);
  node_a->Broadcast("order:o-7", LocationMessage("o-7"));
  assert(other_on_b->Count(ServerMessage::kDriverLocation) == 1);

  // nobody holds the target: silently dropped everywhere
  assert(!node_a->SendTo("rider-unknown", LocationMessage("")));
}

void TestDeadConnectionIsUnregistered() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto conn    = std::make_shared<FakeConnection>();
  gateway->Connect(Rider("rider-1"), conn);

  conn->Kill();
  assert(!gateway->SendTo("rider-1", LocationMessage("")));
  assert(gateway->Stats().connections == 0);
}

void TestPingAndLiveness() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto quiet   = std::make_shared<FakeConnection>();
  auto chatty  = std::make_shared<FakeConnection>();
  gateway->Connect(Rider("rider-quiet"), quiet);
  const auto chatty_id = gateway->Connect(Driver("drv-chatty"), chatty);

  ClientMessage ping;
  ping.mutable_ping();
  gateway->HandleClientMessage(chatty_id, ping);
  assert(chatty->Count(ServerMessage::kPong) == 1);

  const auto now = std::chrono::steady_clock::now();
  gateway->SweepLiveness(now);
  assert(quiet->Count(ServerMessage::kHeartbeat) == 1);
  assert(chatty->Count(ServerMessage::kHeartbeat) == 1);
  assert(gateway->Stats().connections == 2);

  gateway->SweepLiveness(now + std::chrono::seconds(5));
  assert(quiet->Closes() == 1);
  assert(chatty->Closes() == 1);
  assert(gateway->Stats().connections == 0);
  assert(!gateway->SendTo("drv-chatty", LocationMessage("")));
}

void TestLocationHandlerOnlyForDrivers() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");

  std::vector<std::string> reported;
  gateway->SetLocationHandler([&](const auth::Identity& identity, const ClientMessage::DriverLocation& location) {
    if (location.latitude() > 90) throw std::invalid_argument("INVALID_INPUT: bad latitude");
    reported.push_back(identity.id);
  });

  const auto rider_id  = gateway->Connect(Rider("rider-1"), std::make_shared<FakeConnection>());
  const auto driver_id = gateway->Connect(Driver("drv-1"), std::make_shared<FakeConnection>());

  ClientMessage update;
  update.mutable_driver_location()->set_latitude(28.61);
  update.mutable_driver_location()->set_longitude(77.20);

  gateway->HandleClientMessage(rider_id, update);
  assert(reported.empty());

  gateway->HandleClientMessage(driver_id, update);
  assert(reported.size() == 1);
  assert(reported[0] == "drv-1");

  // a rejected update does not tear the connection down
  update.mutable_driver_location()->set_latitude(95);
  gateway->HandleClientMessage(driver_id, update);
  assert(reported.size() == 1);
  assert(gateway->Stats().drivers == 1);
}

void TestBroadcastToRadius() {
  auto repo   = std::make_shared<db::memory::MemoryRepository>();
  auto worker = std::make_shared<async::TaskWorker>("radius-test", 2);
  worker->Start();
  auto geo = std::make_shared<geo::GeoIndex>(std::make_shared<geo::MemoryGeoBackend>(), repo, worker, geo::GeoIndexOptions{});
  geo->Upsert("drv-near", {28.6140, 77.2090}, 0);
  geo->Upsert("drv-skip", {28.6150, 77.2090}, 0);
  geo->Upsert("drv-far", {29.6139, 77.2090}, 0);

  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a", geo);
  auto near    = std::make_shared<FakeConnection>();
  gateway->Connect(Driver("drv-near"), near);

  ServerMessage message;
  message.mutable_heartbeat();
  const auto targeted = gateway->BroadcastToRadius({28.6139, 77.2090}, 5.0, message, {"drv-skip"});
  assert(targeted.size() == 1);
  assert(targeted[0] == "drv-near");
  assert(near->Count(ServerMessage::kHeartbeat) == 1);

  worker->Stop();
}

void TestNotificationSinkRouting() {
  auto gateway = MakeGateway(std::make_shared<cluster::LocalClusterBus>(), "node-a");
  auto rider   = std::make_shared<FakeConnection>();
  auto driver  = std::make_shared<FakeConnection>();
  gateway->Connect(Rider("rider-1"), rider);
  gateway->Connect(Driver("drv-1"), driver);
  rider->Clear();
  driver->Clear();

  realtime::RealtimeNotificationSink sink(gateway);

  db::model::OrderRecord order;
  order.id             = "o-1";
  order.type           = dispatch::core::v1::ORDER_TYPE_RIDE;
  order.status         = dispatch::core::v1::ORDER_STATUS_PENDING;
  order.rider_id       = "rider-1";
  order.pickup_lat     = 28.61;
  order.pickup_lng     = 77.20;
  order.estimated_fare = 12.5;
  order.vehicle_class  = "CAR";

  engine::Candidate candidate;
  candidate.driver_id   = "drv-1";
  candidate.distance_km = 1.23456;
  candidate.eta_minutes = 3;
  sink.OnOffer(order, candidate, 2);

  const auto offers = driver->Received();
  assert(offers.size() == 1);
  const auto& offer = offers[0].new_order_request();
  assert(offer.order_id() == "o-1");
  assert(offer.attempt() == 2);
  assert(offer.distance_to_pickup_km() == 1.23);
  assert(offer.eta_to_pickup_minutes() == 3);
  assert(offer.fare() == 12.5);
  assert(offer.pickup().point().latitude() == 28.61);

  db::model::DriverRecord assigned_driver;
  assigned_driver.id            = "drv-1";
  assigned_driver.rating        = 4.8;
  assigned_driver.vehicle_class = "CAR";
  assigned_driver.plate         = "DL01XY0001";

  engine::OrderChange change;
  change.order           = order;
  change.order.status    = dispatch::core::v1::ORDER_STATUS_DRIVER_ASSIGNED;
  change.order.driver_id = "drv-1";
  change.driver          = assigned_driver;
  change.eta_minutes     = 4;
  sink.OnStatusChanged(change);

  assert(rider->Count(ServerMessage::kOrderUpdate) == 1);
  assert(driver->Count(ServerMessage::kOrderUpdate) == 1);
  const auto update = rider->Received().back().order_update();
  assert(update.driver_id() == "drv-1");
  assert(update.vehicle().plate() == "DL01XY0001");
  assert(update.eta_minutes() == 4);

  // rider cancels: only the driver hears about it
  change.order.status              = dispatch::core::v1::ORDER_STATUS_CANCELLED;
  change.order.cancelled_by        = "rider-1";
  change.order.cancellation_reason = "plans changed";
  sink.OnStatusChanged(change);
  assert(rider->Count(ServerMessage::kOrderUpdate) == 1);
  assert(driver->Count(ServerMessage::kOrderUpdate) == 2);
  assert(driver->Received().back().order_update().reason() == "plans changed");
  assert(driver->Received().back().order_update().cancelled_by() == "rider-1");
}

} // namespace

int main() {
  TestConnectSendsConnected();
  TestReconnectReplacesOldConnection();
  TestChannelBroadcastReachesSubscribersOnly();
  TestBroadcastToRole();
  TestBroadcastToRoleSkipsExcludedIdentities();
  TestQueuedConnectionDoesNotBlockSender();
  TestQueuedConnectionClosesStuckClient();
  TestQueuedConnectionStopsAfterFailedWrite();
  TestSendToRelaysAcrossProcesses();
  TestDeadConnectionIsUnregistered();
  TestPingAndLiveness();
  TestLocationHandlerOnlyForDrivers();
  TestBroadcastToRadius();
  TestNotificationSinkRouting();
  std::cout << "realtime_gateway_test: pass\n";
  return 0;
}
