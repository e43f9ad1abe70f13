#pragma once

#include <cstdint>

namespace dispatch::db::model {

// Aggregates over a driver's order history.
struct DriverOrderStats {
  uint64_t assigned  = 0; // DRIVER_ASSIGNED events where the driver was the actor
  uint64_t completed = 0;
  double   earnings  = 0; // sum of final fares of completed orders
};

} // namespace dispatch::db::model
