#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

/*
  Persistent order row.

  IMPORTANT:
  - status only moves through the transition table in engine/order_state.
  - driver_id is non-empty exactly while status is DRIVER_ASSIGNED..COMPLETED.
  - search_expires_at_ms is the durable accept timer (0 = not searching).
*/

struct OrderRecord {
  std::string id;

  dispatch::core::v1::OrderType   type   = dispatch::core::v1::ORDER_TYPE_UNSPECIFIED;
  dispatch::core::v1::OrderStatus status = dispatch::core::v1::ORDER_STATUS_UNSPECIFIED;

  std::string rider_id;
  std::string driver_id;

  double      pickup_lat = 0;
  double      pickup_lng = 0;
  std::string pickup_address;
  double      dropoff_lat = 0;
  double      dropoff_lng = 0;
  std::string dropoff_address;

  std::string vehicle_class;

  double  distance_km      = 0;
  int32_t duration_minutes = 0;

  double estimated_fare   = 0;
  double final_fare       = 0; // 0 until COMPLETED
  double surge_multiplier = 1.0;

  std::string otp;

  // delivery orders only
  std::string recipient_name;
  std::string recipient_phone;
  std::string package_description;

  uint64_t requested_at_ms = 0;
  uint64_t accepted_at_ms  = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
  uint64_t cancelled_at_ms = 0;

  std::string cancelled_by;
  std::string cancellation_reason;

  uint32_t search_attempts      = 0;
  uint64_t search_expires_at_ms = 0;
};

} // namespace dispatch::db::model
