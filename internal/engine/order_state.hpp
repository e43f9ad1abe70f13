#pragma once

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::engine {

/*
  Order lifecycle.

    PENDING          -> DRIVER_ASSIGNED | CANCELLED
    DRIVER_ASSIGNED  -> DRIVER_ARRIVING | CANCELLED
    DRIVER_ARRIVING  -> DRIVER_ARRIVED  | CANCELLED
    DRIVER_ARRIVED   -> IN_PROGRESS     | CANCELLED
    IN_PROGRESS      -> COMPLETED       | CANCELLED

  COMPLETED and CANCELLED are terminal.
*/

bool IsTerminal(dispatch::core::v1::OrderStatus status);

bool CanTransition(dispatch::core::v1::OrderStatus from, dispatch::core::v1::OrderStatus to);

// True exactly for the states where the order carries a driver.
bool HasDriver(dispatch::core::v1::OrderStatus status);

// "PENDING", "DRIVER_ASSIGNED", ...
const char* StatusName(dispatch::core::v1::OrderStatus status);

dispatch::core::v1::OrderEventType EventFor(dispatch::core::v1::OrderStatus status);

} // namespace dispatch::engine
