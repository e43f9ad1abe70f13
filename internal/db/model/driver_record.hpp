#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

/*
  Driver row. The last_* position is the durable copy of the driver's
  location, written only by the location tracker.
*/
struct DriverRecord {
  std::string id;

  bool online = false;

  dispatch::core::v1::DriverAvailability availability = dispatch::core::v1::DRIVER_AVAILABILITY_RIDE;

  std::string vehicle_class;
  std::string plate;
  std::string model;
  std::string color;

  double   rating           = 5.0;
  uint32_t total_rides      = 0;
  uint32_t total_deliveries = 0;

  bool     has_position           = false;
  double   last_lat               = 0;
  double   last_lng               = 0;
  double   heading                = 0;
  uint64_t location_updated_at_ms = 0;
};

} // namespace dispatch::db::model
