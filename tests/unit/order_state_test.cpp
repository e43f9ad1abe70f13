#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/engine/order_state.hpp"

namespace {

using namespace dispatch::engine;
using namespace dispatch::core::v1;

const std::vector<OrderStatus> kAll = {ORDER_STATUS_PENDING,     ORDER_STATUS_DRIVER_ASSIGNED, ORDER_STATUS_DRIVER_ARRIVING,
                                       ORDER_STATUS_DRIVER_ARRIVED, ORDER_STATUS_IN_PROGRESS,  ORDER_STATUS_COMPLETED,
                                       ORDER_STATUS_CANCELLED};

void TestForwardChain() {
  assert(CanTransition(ORDER_STATUS_PENDING, ORDER_STATUS_DRIVER_ASSIGNED));
  assert(CanTransition(ORDER_STATUS_DRIVER_ASSIGNED, ORDER_STATUS_DRIVER_ARRIVING));
  assert(CanTransition(ORDER_STATUS_DRIVER_ARRIVING, ORDER_STATUS_DRIVER_ARRIVED));
  assert(CanTransition(ORDER_STATUS_DRIVER_ARRIVED, ORDER_STATUS_IN_PROGRESS));
  assert(CanTransition(ORDER_STATUS_IN_PROGRESS, ORDER_STATUS_COMPLETED));
}

void TestNoSkipsOrReversals() {
  assert(!CanTransition(ORDER_STATUS_PENDING, ORDER_STATUS_IN_PROGRESS));
  assert(!CanTransition(ORDER_STATUS_DRIVER_ASSIGNED, ORDER_STATUS_IN_PROGRESS));
  assert(!CanTransition(ORDER_STATUS_DRIVER_ARRIVING, ORDER_STATUS_DRIVER_ASSIGNED));
  assert(!CanTransition(ORDER_STATUS_IN_PROGRESS, ORDER_STATUS_PENDING));
  assert(!CanTransition(ORDER_STATUS_PENDING, ORDER_STATUS_PENDING));
}

void TestCancelFromAnyOpenState() {
  for (const auto status : kAll) {
    const bool open = status != ORDER_STATUS_COMPLETED && status != ORDER_STATUS_CANCELLED;
    assert(CanTransition(status, ORDER_STATUS_CANCELLED) == open);
    assert(IsTerminal(status) == !open);
  }
}

void TestTerminalStatesAreFinal() {
  for (const auto to : kAll) {
    assert(!CanTransition(ORDER_STATUS_COMPLETED, to));
    assert(!CanTransition(ORDER_STATUS_CANCELLED, to));
  }
}

void TestDriverPresence() {
  assert(!HasDriver(ORDER_STATUS_PENDING));
  assert(HasDriver(ORDER_STATUS_DRIVER_ASSIGNED));
  assert(HasDriver(ORDER_STATUS_IN_PROGRESS));
  assert(HasDriver(ORDER_STATUS_COMPLETED));
  assert(!HasDriver(ORDER_STATUS_CANCELLED));
}

void TestNamesAndEvents() {
  assert(std::string(StatusName(ORDER_STATUS_DRIVER_ARRIVED)) == "DRIVER_ARRIVED");
  assert(std::string(StatusName(ORDER_STATUS_PENDING)) == "PENDING");
  assert(EventFor(ORDER_STATUS_IN_PROGRESS) == ORDER_EVENT_TYPE_IN_PROGRESS);
  assert(EventFor(ORDER_STATUS_CANCELLED) == ORDER_EVENT_TYPE_CANCELLED);
  assert(EventFor(ORDER_STATUS_DRIVER_ASSIGNED) == ORDER_EVENT_TYPE_DRIVER_ASSIGNED);
}

} // namespace

int main() {
  TestForwardChain();
  TestNoSkipsOrReversals();
  TestCancelFromAnyOpenState();
  TestTerminalStatesAreFinal();
  TestDriverPresence();
  TestNamesAndEvents();
  std::cout << "order_state_test: pass\n";
  return 0;
}
