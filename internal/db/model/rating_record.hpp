#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

// (order_id, from_id) is unique.
struct RatingRecord {
  std::string order_id;
  std::string from_id;
  std::string to_id;
  int32_t     stars = 0;
  std::string comment;
  uint64_t    created_at_ms = 0;
};

} // namespace dispatch::db::model
