#include "realtime_gateway.hpp"

#include "dispatch/cluster/v1/relay.pb.h"
#include "internal/cluster/cluster_bus.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace dispatch::realtime {

using dispatch::observability::IntField;
using dispatch::observability::StringField;
using dispatch::realtime::v1::ClientMessage;
using dispatch::realtime::v1::ServerMessage;

namespace {

void Stamp(ServerMessage& message) {
  *message.mutable_timestamp() = util::NowProto();
}

} // namespace

RealtimeGateway::RealtimeGateway(GatewayOptions options, std::shared_ptr<cluster::ClusterBus> bus, std::shared_ptr<geo::GeoIndex> geo)
    : options_(std::move(options)), bus_(std::move(bus)), geo_(std::move(geo)) {
}

void RealtimeGateway::Start() {
  bus_->Subscribe(cluster::kRelayTopic, [this](const std::string& payload) { OnRelay(payload); });
  bus_->Subscribe(cluster::kBroadcastTopic, [this](const std::string& payload) { OnBroadcast(payload); });
}

// ------------------------------------------------------------
// Registry
// ------------------------------------------------------------

ConnectionId RealtimeGateway::Connect(const auth::Identity& identity, std::shared_ptr<Connection> connection) {
  std::shared_ptr<Connection> replaced;
  ConnectionId                id = 0;
  {
    std::lock_guard lock(mutex_);

    auto previous = by_identity_.find(identity.id);
    if (previous != by_identity_.end()) {
      auto old = connections_.find(previous->second);
      if (old != connections_.end()) {
        replaced = old->second.connection;
        connections_.erase(old);
      }
    }

    id = next_id_++;

    Entry entry;
    entry.identity   = identity;
    entry.connection = connection;
    entry.last_seen  = std::chrono::steady_clock::now();

    connections_.emplace(id, std::move(entry));
    by_identity_[identity.id] = id;
  }

  if (replaced) {
    DISPATCH_LOG_INFO("replacing existing realtime connection", {StringField("identity", identity.id)});
    replaced->Close();
  }

  DISPATCH_LOG_INFO("realtime client connected", {StringField("identity", identity.id), StringField("role", auth::ToString(identity.role))});

  ServerMessage hello;
  auto*         connected = hello.mutable_connected();
  connected->set_identity(identity.id);
  connected->set_role(auth::ToString(identity.role));
  connected->set_instance_id(options_.instance_id);
  Stamp(hello);
  Send(id, connection, hello);

  PublishCounts();
  return id;
}

void RealtimeGateway::Disconnect(ConnectionId id) {
  std::string identity;
  {
    std::lock_guard lock(mutex_);

    auto it = connections_.find(id);
    if (it == connections_.end()) return;

    identity = it->second.identity.id;
    connections_.erase(it);

    auto owner = by_identity_.find(identity);
    if (owner != by_identity_.end() && owner->second == id) {
      by_identity_.erase(owner);
    }
  }

  DISPATCH_LOG_INFO("realtime client disconnected", {StringField("identity", identity)});
  PublishCounts();
}

void RealtimeGateway::Subscribe(ConnectionId id, const std::string& channel) {
  std::shared_ptr<Connection> connection;
  {
    std::lock_guard lock(mutex_);
    auto            it = connections_.find(id);
    if (it == connections_.end()) return;
    it->second.channels.insert(channel);
    connection = it->second.connection;
  }

  DISPATCH_LOG_DEBUG("realtime client subscribed", {StringField("channel", channel)});

  ServerMessage ack;
  ack.mutable_subscribed()->set_channel(channel);
  Stamp(ack);
  Send(id, connection, ack);
}

void RealtimeGateway::Unsubscribe(ConnectionId id, const std::string& channel) {
  std::lock_guard lock(mutex_);
  auto            it = connections_.find(id);
  if (it != connections_.end()) {
    it->second.channels.erase(channel);
  }
}

void RealtimeGateway::Touch(ConnectionId id) {
  std::lock_guard lock(mutex_);
  auto            it = connections_.find(id);
  if (it != connections_.end()) {
    it->second.last_seen = std::chrono::steady_clock::now();
  }
}

void RealtimeGateway::SetLocationHandler(LocationHandler handler) {
  std::lock_guard lock(mutex_);
  location_handler_ = std::move(handler);
}

// ------------------------------------------------------------
// Inbound
// ------------------------------------------------------------

void RealtimeGateway::HandleClientMessage(ConnectionId id, const ClientMessage& message) {
  Touch(id);

  switch (message.payload_case()) {
    case ClientMessage::kSubscribe:
      Subscribe(id, message.subscribe().channel());
      return;

    case ClientMessage::kUnsubscribe:
      Unsubscribe(id, message.unsubscribe().channel());
      return;

    case ClientMessage::kPing: {
      std::shared_ptr<Connection> connection;
      {
        std::lock_guard lock(mutex_);
        auto            it = connections_.find(id);
        if (it == connections_.end()) return;
        connection = it->second.connection;
      }
      ServerMessage pong;
      pong.mutable_pong();
      Stamp(pong);
      Send(id, connection, pong);
      return;
    }

    case ClientMessage::kDriverLocation: {
      auth::Identity  identity;
      LocationHandler handler;
      {
        std::lock_guard lock(mutex_);
        auto            it = connections_.find(id);
        if (it == connections_.end()) return;
        identity = it->second.identity;
        handler  = location_handler_;
      }
      if (identity.role != auth::Role::kDriver || !handler) return;

      try {
        handler(identity, message.driver_location());
      } catch (const std::exception& e) {
        DISPATCH_LOG_WARN("realtime location update rejected", {StringField("identity", identity.id), StringField("error", e.what())});
      }
      return;
    }

    case ClientMessage::PAYLOAD_NOT_SET:
      DISPATCH_LOG_WARN("realtime message without payload");
      return;
  }
}

// ------------------------------------------------------------
// Outbound
// ------------------------------------------------------------

bool RealtimeGateway::SendTo(const std::string& identity, ServerMessage message) {
  Stamp(message);
  if (DeliverLocal(identity, message)) {
    return true;
  }

  DISPATCH_LOG_DEBUG("identity not connected here, relaying", {StringField("identity", identity), StringField("instance_id", options_.instance_id)});

  dispatch::cluster::v1::RelayMessage relay;
  relay.set_target_identity(identity);
  *relay.mutable_message() = std::move(message);
  bus_->Publish(cluster::kRelayTopic, relay.SerializeAsString());
  return false;
}

void RealtimeGateway::Broadcast(const std::string& channel, ServerMessage message) {
  Stamp(message);

  dispatch::cluster::v1::BroadcastMessage broadcast;
  broadcast.set_channel(channel);
  *broadcast.mutable_message() = std::move(message);
  bus_->Publish(cluster::kBroadcastTopic, broadcast.SerializeAsString());
}

void RealtimeGateway::BroadcastToRole(auth::Role role, ServerMessage message, const std::unordered_set<std::string>& exclude) {
  Stamp(message);

  dispatch::cluster::v1::BroadcastMessage broadcast;
  broadcast.set_role(auth::ToString(role));
  for (const auto& identity : exclude) {
    broadcast.add_exclude_identities(identity);
  }
  *broadcast.mutable_message() = std::move(message);
  bus_->Publish(cluster::kBroadcastTopic, broadcast.SerializeAsString());
}

std::vector<std::string> RealtimeGateway::BroadcastToRadius(const geo::Coordinates& center, double radius_km, const ServerMessage& message,
                                                            const std::unordered_set<std::string>& exclude) {
  std::vector<std::string> targeted;
  if (!geo_) return targeted;

  for (const auto& hit : geo_->Query(center, radius_km, 0)) {
    if (exclude.count(hit.driver_id)) continue;
    SendTo(hit.driver_id, message);
    targeted.push_back(hit.driver_id);
  }

  DISPATCH_LOG_INFO("radius broadcast", {IntField("targeted", static_cast<int64_t>(targeted.size())),
                                         IntField("excluded", static_cast<int64_t>(exclude.size()))});
  return targeted;
}

void RealtimeGateway::OnRelay(const std::string& payload) {
  dispatch::cluster::v1::RelayMessage relay;
  if (!relay.ParseFromString(payload)) {
    DISPATCH_LOG_WARN("dropping malformed relay message");
    return;
  }

  // A miss here is expected on every process but the owner.
  if (DeliverLocal(relay.target_identity(), relay.message())) {
    DISPATCH_LOG_DEBUG("relayed message delivered", {StringField("identity", relay.target_identity())});
  }
}

void RealtimeGateway::OnBroadcast(const std::string& payload) {
  dispatch::cluster::v1::BroadcastMessage broadcast;
  if (!broadcast.ParseFromString(payload)) {
    DISPATCH_LOG_WARN("dropping malformed broadcast message");
    return;
  }

  const std::unordered_set<std::string> excluded(broadcast.exclude_identities().begin(), broadcast.exclude_identities().end());

  std::vector<std::pair<ConnectionId, std::shared_ptr<Connection>>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : connections_) {
      if (!broadcast.channel().empty() && !entry.channels.count(broadcast.channel())) continue;
      if (!broadcast.role().empty() && broadcast.role() != auth::ToString(entry.identity.role)) continue;
      if (excluded.count(entry.identity.id)) continue;
      targets.emplace_back(id, entry.connection);
    }
  }

  for (const auto& [id, connection] : targets) {
    Send(id, connection, broadcast.message());
  }
}

bool RealtimeGateway::DeliverLocal(const std::string& identity, const ServerMessage& message) {
  ConnectionId                id = 0;
  std::shared_ptr<Connection> connection;
  {
    std::lock_guard lock(mutex_);
    auto            owner = by_identity_.find(identity);
    if (owner == by_identity_.end()) return false;

    id         = owner->second;
    connection = connections_.at(id).connection;
  }

  if (!connection->Send(message)) {
    Disconnect(id);
    return false;
  }
  return true;
}

void RealtimeGateway::Send(ConnectionId id, const std::shared_ptr<Connection>& connection, const ServerMessage& message) {
  if (!connection->Send(message)) {
    Disconnect(id);
  }
}

// ------------------------------------------------------------
// Liveness
// ------------------------------------------------------------

void RealtimeGateway::SweepLiveness(std::chrono::steady_clock::time_point now) {
  const auto timeout = std::chrono::milliseconds(options_.liveness_timeout_ms);

  std::vector<std::pair<ConnectionId, std::shared_ptr<Connection>>> alive;
  std::vector<std::pair<std::string, std::shared_ptr<Connection>>>  expired;
  {
    std::lock_guard lock(mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (now - it->second.last_seen > timeout) {
        expired.emplace_back(it->second.identity.id, it->second.connection);

        auto owner = by_identity_.find(it->second.identity.id);
        if (owner != by_identity_.end() && owner->second == it->first) {
          by_identity_.erase(owner);
        }
        it = connections_.erase(it);
      } else {
        alive.emplace_back(it->first, it->second.connection);
        ++it;
      }
    }
  }

  for (const auto& [identity, connection] : expired) {
    DISPATCH_LOG_WARN("realtime client timed out", {StringField("identity", identity)});
    connection->Close();
  }

  ServerMessage heartbeat;
  heartbeat.mutable_heartbeat();
  Stamp(heartbeat);
  for (const auto& [id, connection] : alive) {
    Send(id, connection, heartbeat);
  }

  if (!expired.empty()) PublishCounts();
}

GatewayStats RealtimeGateway::Stats() {
  std::lock_guard lock(mutex_);

  GatewayStats stats;
  stats.connections = connections_.size();
  for (const auto& [id, entry] : connections_) {
    if (entry.identity.role == auth::Role::kDriver) {
      ++stats.drivers;
    } else {
      ++stats.riders;
    }
  }
  return stats;
}

void RealtimeGateway::PublishCounts() {
  const auto stats = Stats();
  observability::Metrics::Instance().SetRealtimeConnections("rider", static_cast<int64_t>(stats.riders));
  observability::Metrics::Instance().SetRealtimeConnections("driver", static_cast<int64_t>(stats.drivers));
}

} // namespace dispatch::realtime
