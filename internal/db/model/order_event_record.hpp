#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

struct OrderEventRecord {
  std::string order_id;

  dispatch::core::v1::OrderEventType type = dispatch::core::v1::ORDER_EVENT_TYPE_UNSPECIFIED;

  std::string actor_id;

  bool   has_position = false;
  double lat          = 0;
  double lng          = 0;

  uint64_t at_ms = 0;
};

} // namespace dispatch::db::model
