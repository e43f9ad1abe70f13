#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

// One explicit decline of an order by a driver. Append-only.
struct DeclineRecord {
  std::string order_id;
  std::string driver_id;
  std::string reason;
  uint64_t    declined_at_ms = 0;
};

} // namespace dispatch::db::model
