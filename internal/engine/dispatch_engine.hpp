#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "fare_table.hpp"
#include "notification_sink.hpp"

namespace dispatch::db {
class Repository;
}
namespace dispatch::geo {
class GeoIndex;
}

namespace dispatch::engine {

struct EngineOptions {
  double   search_radius_km     = 10.0;
  uint32_t accept_timeout_ms    = 30'000;
  uint32_t max_search_attempts  = 0; // 0 = search until accepted or cancelled
  uint32_t candidate_limit      = 20;
  double   road_distance_factor = 1.4;
  double   average_speed_kmh    = 30.0;
  uint32_t sweep_batch          = 100;
};

// Pickup ETA reported when no candidate is nearby.
inline constexpr int32_t kDefaultPickupMinutes = 15;

struct EstimateInput {
  dispatch::core::v1::OrderType type = dispatch::core::v1::ORDER_TYPE_UNSPECIFIED;
  geo::Coordinates              pickup;
  geo::Coordinates              dropoff;
  std::string                   vehicle_class;
};

struct FareEstimate {
  VehicleClass vehicle_class = VehicleClass::kCar;
  double       distance_km   = 0;
  int32_t      duration_minutes = 0;
  FareQuote    fare;
  double       surge_multiplier = 1.0;
  uint32_t     nearby_drivers   = 0;
  int32_t      pickup_minutes   = kDefaultPickupMinutes;
};

struct NewOrder {
  std::string                   rider_id;
  dispatch::core::v1::OrderType type = dispatch::core::v1::ORDER_TYPE_UNSPECIFIED;
  geo::Coordinates              pickup;
  std::string                   pickup_address;
  geo::Coordinates              dropoff;
  std::string                   dropoff_address;
  std::string                   vehicle_class;

  std::string recipient_name;
  std::string recipient_phone;
  std::string package_description;
};

struct CreatedOrder {
  db::model::OrderRecord order;
  uint32_t               offered_drivers = 0;
};

struct StatusChange {
  std::string                     order_id;
  std::string                     actor_id;
  dispatch::core::v1::OrderStatus status = dispatch::core::v1::ORDER_STATUS_UNSPECIFIED;
  std::string                     otp;
  std::optional<geo::Coordinates> position;
};

struct CandidateQuery {
  geo::Coordinates              center;
  double                        radius_km = 0;
  dispatch::core::v1::OrderType type      = dispatch::core::v1::ORDER_TYPE_UNSPECIFIED; // unspecified: any availability
  std::optional<VehicleClass>   vehicle_class;
  std::unordered_set<std::string> exclude;
  uint32_t                      limit = 0; // 0 = no limit
};

/*
  DispatchEngine

  Owns the order lifecycle: estimate, create, offer, accept, decline,
  progress, cancel and the search timeout loop.

  Every state change is one repository transaction. The accept path
  relies on the repository's AssignDriverIfPending compare-and-set, so
  two drivers racing for the same order from different processes get
  exactly one winner. Commits that lose an optimistic race are retried
  from the start.

  Offers and status notifications go to the registered sinks only after
  the commit succeeded.
*/
class DispatchEngine {
 public:
  using MillisClock = std::function<uint64_t()>;

  DispatchEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::GeoIndex> geo, FareTable fares, EngineOptions options,
                 MillisClock clock = {});

  void AddSink(std::shared_ptr<NotificationSink> sink);

  FareEstimate Estimate(const EstimateInput& input);

  // The order is persisted PENDING even when nobody is nearby.
  CreatedOrder CreateOrder(const NewOrder& request);

  // Throws DRIVER_OFFLINE for offline drivers and DRIVER_BUSY while the
  // driver still has a non-terminal order.
  db::model::OrderRecord AcceptOrder(const std::string& order_id, const std::string& driver_id);

  // Silently ignored once the order left PENDING.
  void DeclineOrder(const std::string& order_id, const std::string& driver_id, const std::string& reason);

  // DRIVER_ASSIGNED routes to AcceptOrder, CANCELLED to CancelOrder.
  db::model::OrderRecord UpdateStatus(const StatusChange& change);

  db::model::OrderRecord CancelOrder(const std::string& order_id, const std::string& actor_id, const std::string& reason);

  void RateOrder(const std::string& order_id, const std::string& from_id, int32_t stars, const std::string& comment);

  // Claims and rebroadcasts every search whose accept timer expired.
  // Returns the number of expiries this call won.
  size_t SweepExpiredSearches(uint64_t now_ms);

  std::vector<Candidate> FindCandidates(const CandidateQuery& query);

  // Sends the order's offer to every eligible driver not in exclude.
  uint32_t Rebroadcast(const db::model::OrderRecord& order, const std::unordered_set<std::string>& exclude);

  const FareTable& Fares() const {
    return fares_;
  }

  const EngineOptions& Options() const {
    return options_;
  }

 private:
  std::unordered_set<std::string> DeclinedDrivers(const std::string& order_id);
  int32_t                         PickupEta(const std::string& driver_id, const db::model::OrderRecord& order);

  void Offer(const db::model::OrderRecord& order, const std::vector<Candidate>& candidates, uint32_t attempt);
  void Notify(const OrderChange& change);

  uint64_t Now() const;

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<geo::GeoIndex>                 geo_;
  FareTable                                      fares_;
  EngineOptions                                  options_;
  MillisClock                                    clock_;
  std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

} // namespace dispatch::engine
