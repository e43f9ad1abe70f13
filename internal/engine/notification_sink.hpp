#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/driver_record.hpp"
#include "internal/db/model/order_record.hpp"
#include "internal/geo/geo_math.hpp"

namespace dispatch::engine {

// A driver eligible for an offer, nearest first.
struct Candidate {
  std::string              driver_id;
  double                   distance_km = 0;
  int32_t                  eta_minutes = 0;
  geo::Coordinates         position;
  db::model::DriverRecord  driver;
};

// A committed lifecycle change.
struct OrderChange {
  db::model::OrderRecord          order;
  dispatch::core::v1::OrderStatus previous_status = dispatch::core::v1::ORDER_STATUS_UNSPECIFIED;
  std::string                     actor_id;

  // The driver involved: the assignee, or for a cancel the driver that
  // was assigned before it.
  std::optional<db::model::DriverRecord> driver;

  int32_t eta_minutes = 0;
};

/*
  Receives engine outcomes after the transaction committed.

  Sinks run in registration order. A throwing sink is logged under its
  Name() and skipped; the change it reports is never rolled back.
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual const char* Name() const = 0;

  virtual void OnOffer(const db::model::OrderRecord& order, const Candidate& candidate, uint32_t attempt) = 0;

  virtual void OnStatusChanged(const OrderChange& change) = 0;
};

} // namespace dispatch::engine
