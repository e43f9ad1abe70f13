#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "connection.hpp"
#include "internal/auth/identity.hpp"
#include "internal/geo/geo_math.hpp"

namespace dispatch::cluster {
class ClusterBus;
}
namespace dispatch::geo {
class GeoIndex;
}

namespace dispatch::realtime {

struct GatewayOptions {
  std::string instance_id;
  uint32_t    heartbeat_interval_ms = 30'000;
  uint32_t    liveness_timeout_ms   = 60'000;
};

struct GatewayStats {
  uint64_t connections = 0;
  uint64_t riders      = 0;
  uint64_t drivers     = 0;
};

using ConnectionId = uint64_t;

// Channel carrying one order's live events.
inline std::string OrderChannel(const std::string& order_id) {
  return "order:" + order_id;
}

// Driver position pushed over the realtime stream.
using LocationHandler = std::function<void(const auth::Identity&, const dispatch::realtime::v1::ClientMessage::DriverLocation&)>;

/*
  RealtimeGateway

  Registry of the connections this process owns, keyed by identity. One
  live connection per identity: a reconnect replaces and closes the old
  one.

  Anything addressed to an identity or a channel goes out through the
  cluster bus when it cannot be satisfied locally, so callers never need
  to know which process holds a connection. Every outbound message is
  stamped with the server time here.
*/
class RealtimeGateway {
 public:
  RealtimeGateway(GatewayOptions options, std::shared_ptr<cluster::ClusterBus> bus, std::shared_ptr<geo::GeoIndex> geo);

  // Subscribes the relay and broadcast topics. Call once before serving.
  void Start();

  // The identity must already be verified. Sends `connected`.
  ConnectionId Connect(const auth::Identity& identity, std::shared_ptr<Connection> connection);

  // No-op when the connection was already replaced or swept.
  void Disconnect(ConnectionId id);

  void Subscribe(ConnectionId id, const std::string& channel);
  void Unsubscribe(ConnectionId id, const std::string& channel);

  // Marks the connection alive.
  void Touch(ConnectionId id);

  void HandleClientMessage(ConnectionId id, const dispatch::realtime::v1::ClientMessage& message);

  void SetLocationHandler(LocationHandler handler);

  // True when delivered to a local connection. Otherwise the message is
  // relayed to the other processes and false is returned.
  bool SendTo(const std::string& identity, dispatch::realtime::v1::ServerMessage message);

  // Every subscriber of the channel, cluster-wide.
  void Broadcast(const std::string& channel, dispatch::realtime::v1::ServerMessage message);

  // Every connection with the role, cluster-wide, minus exclude.
  void BroadcastToRole(auth::Role role, dispatch::realtime::v1::ServerMessage message, const std::unordered_set<std::string>& exclude = {});

  // Drivers indexed within radius_km, minus exclude. Returns the targeted ids.
  std::vector<std::string> BroadcastToRadius(const geo::Coordinates& center, double radius_km, const dispatch::realtime::v1::ServerMessage& message,
                                             const std::unordered_set<std::string>& exclude);

  // Heartbeats live connections and closes those silent past the liveness
  // timeout. Driven by LivenessMonitor.
  void SweepLiveness(std::chrono::steady_clock::time_point now);

  GatewayStats Stats();

  const GatewayOptions& Options() const {
    return options_;
  }

 private:
  struct Entry {
    auth::Identity                        identity;
    std::shared_ptr<Connection>           connection;
    std::unordered_set<std::string>       channels;
    std::chrono::steady_clock::time_point last_seen;
  };

  void OnRelay(const std::string& payload);
  void OnBroadcast(const std::string& payload);

  bool DeliverLocal(const std::string& identity, const dispatch::realtime::v1::ServerMessage& message);
  void Send(ConnectionId id, const std::shared_ptr<Connection>& connection, const dispatch::realtime::v1::ServerMessage& message);
  void PublishCounts();

  GatewayOptions                       options_;
  std::shared_ptr<cluster::ClusterBus> bus_;
  std::shared_ptr<geo::GeoIndex>       geo_;

  std::mutex                                    mutex_;
  ConnectionId                                  next_id_ = 1;
  std::unordered_map<ConnectionId, Entry>       connections_;
  std::unordered_map<std::string, ConnectionId> by_identity_;
  LocationHandler                               location_handler_;
};

} // namespace dispatch::realtime
