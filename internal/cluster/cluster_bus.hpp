#pragma once

#include <functional>
#include <string>

namespace dispatch::cluster {

// Point-to-point: RelayMessage for whichever process owns the target.
inline constexpr const char* kRelayTopic = "realtime.relay";
// Cluster-wide fan-out: BroadcastMessage.
inline constexpr const char* kBroadcastTopic = "realtime.broadcast";
// Accepted driver positions: DriverLocation.
inline constexpr const char* kDriverLocationTopic = "driver.location";

using Handler = std::function<void(const std::string& payload)>;

/*
  Publish/subscribe fabric between dispatch processes.

  Publish reaches the local subscribers and every peer process.
  Delivery is at-most-once and best effort; Publish never throws.
*/
class ClusterBus {
 public:
  virtual ~ClusterBus() = default;

  virtual void Publish(const std::string& topic, const std::string& payload) = 0;
  virtual void Subscribe(const std::string& topic, Handler handler)         = 0;
};

} // namespace dispatch::cluster
