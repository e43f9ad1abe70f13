#include "order_state.hpp"

namespace dispatch::engine {

using namespace dispatch::core::v1;

bool IsTerminal(OrderStatus status) {
  return status == ORDER_STATUS_COMPLETED || status == ORDER_STATUS_CANCELLED;
}

bool CanTransition(OrderStatus from, OrderStatus to) {
  if (to == ORDER_STATUS_CANCELLED) {
    return from != ORDER_STATUS_UNSPECIFIED && !IsTerminal(from);
  }

  switch (from) {
    case ORDER_STATUS_PENDING:
      return to == ORDER_STATUS_DRIVER_ASSIGNED;
    case ORDER_STATUS_DRIVER_ASSIGNED:
      return to == ORDER_STATUS_DRIVER_ARRIVING;
    case ORDER_STATUS_DRIVER_ARRIVING:
      return to == ORDER_STATUS_DRIVER_ARRIVED;
    case ORDER_STATUS_DRIVER_ARRIVED:
      return to == ORDER_STATUS_IN_PROGRESS;
    case ORDER_STATUS_IN_PROGRESS:
      return to == ORDER_STATUS_COMPLETED;
    default:
      return false;
  }
}

bool HasDriver(OrderStatus status) {
  switch (status) {
    case ORDER_STATUS_DRIVER_ASSIGNED:
    case ORDER_STATUS_DRIVER_ARRIVING:
    case ORDER_STATUS_DRIVER_ARRIVED:
    case ORDER_STATUS_IN_PROGRESS:
    case ORDER_STATUS_COMPLETED:
      return true;
    default:
      return false;
  }
}

const char* StatusName(OrderStatus status) {
  switch (status) {
    case ORDER_STATUS_PENDING:
      return "PENDING";
    case ORDER_STATUS_DRIVER_ASSIGNED:
      return "DRIVER_ASSIGNED";
    case ORDER_STATUS_DRIVER_ARRIVING:
      return "DRIVER_ARRIVING";
    case ORDER_STATUS_DRIVER_ARRIVED:
      return "DRIVER_ARRIVED";
    case ORDER_STATUS_IN_PROGRESS:
      return "IN_PROGRESS";
    case ORDER_STATUS_COMPLETED:
      return "COMPLETED";
    case ORDER_STATUS_CANCELLED:
      return "CANCELLED";
    default:
      return "UNSPECIFIED";
  }
}

OrderEventType EventFor(OrderStatus status) {
  switch (status) {
    case ORDER_STATUS_PENDING:
      return ORDER_EVENT_TYPE_CREATED;
    case ORDER_STATUS_DRIVER_ASSIGNED:
      return ORDER_EVENT_TYPE_DRIVER_ASSIGNED;
    case ORDER_STATUS_DRIVER_ARRIVING:
      return ORDER_EVENT_TYPE_DRIVER_ARRIVING;
    case ORDER_STATUS_DRIVER_ARRIVED:
      return ORDER_EVENT_TYPE_DRIVER_ARRIVED;
    case ORDER_STATUS_IN_PROGRESS:
      return ORDER_EVENT_TYPE_IN_PROGRESS;
    case ORDER_STATUS_COMPLETED:
      return ORDER_EVENT_TYPE_COMPLETED;
    case ORDER_STATUS_CANCELLED:
      return ORDER_EVENT_TYPE_CANCELLED;
    default:
      return ORDER_EVENT_TYPE_UNSPECIFIED;
  }
}

} // namespace dispatch::engine
