#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "service_fixture.hpp"

namespace {

using namespace dispatch;
using namespace dispatch::core::v1;
using namespace dispatch::services::v1;
using dispatch::testing::ServiceFixture;

const auth::Identity kRider{"rider-1", auth::Role::kRider};
const auth::Identity kOtherRider{"rider-2", auth::Role::kRider};
const auth::Identity kDriver{"drv-1", auth::Role::kDriver};
const auth::Identity kOtherDriver{"drv-2", auth::Role::kDriver};

// Counts offers; on_offer runs inside the fan-out.
class OfferInbox final : public realtime::Connection {
 public:
  bool Send(const dispatch::realtime::v1::ServerMessage& message) override {
    std::function<void(const std::string&)> hook;
    {
      std::lock_guard lock(mutex_);
      if (!message.has_new_order_request()) return true;
      ++offers_;
      hook = on_offer;
    }
    if (hook) hook(message.new_order_request().order_id());
    return true;
  }

  void Close() override {
  }

  int Offers() {
    std::lock_guard lock(mutex_);
    return offers_;
  }

  std::function<void(const std::string&)> on_offer;

 private:
  std::mutex mutex_;
  int        offers_ = 0;
};

template <typename Fn>
bool ThrowsForbidden(Fn&& fn) {
  try {
    fn();
  } catch (const util::Forbidden&) {
    return true;
  }
  return false;
}

Order Advance(ServiceFixture& f, const std::string& order_id, OrderStatus status, const std::string& otp = "") {
  UpdateOrderStatusRequest req;
  req.set_order_id(order_id);
  req.set_status(status);
  req.set_otp(otp);
  return f.orders->UpdateOrderStatus(kDriver, req).order();
}

void TestRolesAreEnforced() {
  ServiceFixture f;
  const auto     ride = ServiceFixture::RideRequest();

  assert(ThrowsForbidden([&] { f.orders->CreateOrder(kDriver, ride); }));

  RegisterDriverRequest registration;
  assert(ThrowsForbidden([&] { f.drivers->RegisterDriver(kRider, registration); }));

  const auto created = f.orders->CreateOrder(kRider, ride);

  AcceptOrderRequest accept;
  accept.set_order_id(created.order().id());
  assert(ThrowsForbidden([&] { f.orders->AcceptOrder(kRider, accept); }));

  UpdateOrderStatusRequest advance;
  advance.set_order_id(created.order().id());
  advance.set_status(ORDER_STATUS_DRIVER_ARRIVING);
  assert(ThrowsForbidden([&] { f.orders->UpdateOrderStatus(kRider, advance); }));
}

void TestOtpVisibleOnlyToRider() {
  ServiceFixture f;
  f.OnlineDriver(kDriver.id, -33.8788, 151.2093);

  const auto created = f.orders->CreateOrder(kRider, ServiceFixture::RideRequest());
  assert(created.offered_drivers() == 1);
  assert(created.order().otp().size() == 4);

  GetOrderRequest get;
  get.set_order_id(created.order().id());

  // A pending order is readable by any driver, without the code.
  const auto driver_view = f.orders->GetOrder(kOtherDriver, get);
  assert(driver_view.order().status() == ORDER_STATUS_PENDING);
  assert(driver_view.order().otp().empty());

  assert(ThrowsForbidden([&] { f.orders->GetOrder(kOtherRider, get); }));

  AcceptOrderRequest accept;
  accept.set_order_id(created.order().id());
  const auto accepted = f.orders->AcceptOrder(kDriver, accept);
  assert(accepted.order().driver_id() == kDriver.id);
  assert(accepted.order().otp().empty());

  // Once assigned, only the parties may read it.
  assert(ThrowsForbidden([&] { f.orders->GetOrder(kOtherDriver, get); }));
  assert(f.orders->GetOrder(kRider, get).order().otp() == created.order().otp());
}

void TestLifecycleThroughServices() {
  ServiceFixture f;
  f.OnlineDriver(kDriver.id, -33.8788, 151.2093);

  const auto  created  = f.orders->CreateOrder(kRider, ServiceFixture::RideRequest());
  const auto& order_id = created.order().id();

  AcceptOrderRequest accept;
  accept.set_order_id(order_id);
  f.orders->AcceptOrder(kDriver, accept);

  GetActiveOrderRequest active_req;
  const auto            rider_active = f.orders->GetActiveOrder(kRider, active_req);
  assert(rider_active.found());
  assert(rider_active.order().id() == order_id);
  assert(f.orders->GetActiveOrder(kDriver, active_req).found());
  assert(!f.orders->GetActiveOrder(kOtherRider, active_req).found());

  Advance(f, order_id, ORDER_STATUS_DRIVER_ARRIVING);
  Advance(f, order_id, ORDER_STATUS_DRIVER_ARRIVED);

  bool rejected = false;
  try {
    Advance(f, order_id, ORDER_STATUS_IN_PROGRESS, "0000" == created.order().otp() ? "1111" : "0000");
  } catch (const util::ValidationFailed& e) {
    rejected = e.code() == "INVALID_OTP";
  }
  assert(rejected);

  Advance(f, order_id, ORDER_STATUS_IN_PROGRESS, created.order().otp());
  const auto completed = Advance(f, order_id, ORDER_STATUS_COMPLETED);
  assert(completed.status() == ORDER_STATUS_COMPLETED);
  assert(completed.final_fare() == created.order().estimated_fare());
  assert(!f.orders->GetActiveOrder(kRider, active_req).found());

  ListOrderEventsRequest events_req;
  events_req.set_order_id(order_id);
  const auto events = f.orders->ListOrderEvents(kRider, events_req);
  assert(events.events_size() == 6);
  assert(events.events(0).type() == ORDER_EVENT_TYPE_CREATED);
  assert(events.events(5).type() == ORDER_EVENT_TYPE_COMPLETED);

  RateOrderRequest rate;
  rate.set_order_id(order_id);
  rate.set_stars(4);
  rate.set_comment("smooth ride");
  f.orders->RateOrder(kRider, rate);

  bool again = false;
  try {
    f.orders->RateOrder(kRider, rate);
  } catch (const util::Conflict& e) {
    again = e.code() == "ALREADY_RATED";
  }
  assert(again);

  GetDriverStatsRequest stats_req;
  const auto            stats = f.drivers->GetDriverStats(kDriver, stats_req);
  assert(stats.total_rides() == 1);
  assert(stats.total_deliveries() == 0);
  assert(stats.rating() == 4.0);
  assert(stats.completion_rate() == 1.0);
  assert(stats.total_earnings() > 0);
}

void TestHistoryPaging() {
  ServiceFixture f;
  for (int i = 0; i < 5; ++i) {
    f.orders->CreateOrder(kRider, ServiceFixture::RideRequest());
  }
  f.orders->CreateOrder(kOtherRider, ServiceFixture::RideRequest());

  ListOrderHistoryRequest req;
  const auto              first = f.orders->ListOrderHistory(kRider, req);
  assert(first.page() == 1);
  assert(first.page_size() == 20);
  assert(first.total() == 5);
  assert(first.orders_size() == 5);

  req.set_page(2);
  req.set_page_size(2);
  const auto second = f.orders->ListOrderHistory(kRider, req);
  assert(second.orders_size() == 2);
  assert(second.total() == 5);
  assert(second.orders(0).id() == first.orders(2).id());

  req.set_page(1);
  req.set_page_size(1000);
  assert(f.orders->ListOrderHistory(kRider, req).page_size() == 100);
}

void TestDriverRegistrationDefaults() {
  ServiceFixture f;

  RegisterDriverRequest ride;
  const auto            registered = f.drivers->RegisterDriver(kDriver, ride);
  assert(registered.driver().availability() == DRIVER_AVAILABILITY_RIDE);
  assert(registered.driver().vehicle().vehicle_class() == "CAR");
  assert(!registered.driver().online());

  bool duplicate = false;
  try {
    f.drivers->RegisterDriver(kDriver, ride);
  } catch (const util::AlreadyExists& e) {
    duplicate = e.code() == "DRIVER_ALREADY_EXISTS";
  }
  assert(duplicate);

  RegisterDriverRequest courier;
  courier.set_availability(DRIVER_AVAILABILITY_DELIVERY);
  assert(f.drivers->RegisterDriver(kOtherDriver, courier).driver().vehicle().vehicle_class() == "SMALL");

  RegisterDriverRequest mismatched;
  mismatched.mutable_vehicle()->set_vehicle_class("LARGE");
  bool rejected = false;
  try {
    f.drivers->RegisterDriver(auth::Identity{"drv-3", auth::Role::kDriver}, mismatched);
  } catch (const util::ValidationFailed& e) {
    rejected = e.code() == "UNKNOWN_VEHICLE_CLASS";
  }
  assert(rejected);

  GetDriverStatsRequest stats_req;
  assert(f.drivers->GetDriverStats(kDriver, stats_req).completion_rate() == 1.0);
}

void TestAvailabilityControlsIndex() {
  ServiceFixture f;
  f.OnlineDriver(kDriver.id, -33.8788, 151.2093);
  f.OnlineDriver(kOtherDriver.id, -33.9188, 151.2093);
  assert(f.ctx.geo->IndexedCount() == 2);

  FindNearbyDriversRequest nearby;
  nearby.mutable_center()->set_latitude(-33.8688);
  nearby.mutable_center()->set_longitude(151.2093);
  nearby.set_radius_km(10);
  nearby.set_type(ORDER_TYPE_RIDE);

  const auto both = f.drivers->FindNearbyDrivers(kRider, nearby);
  assert(both.drivers_size() == 2);
  assert(both.drivers(0).driver_id() == kDriver.id);
  assert(both.drivers(0).distance_km() < both.drivers(1).distance_km());

  SetAvailabilityRequest offline;
  offline.set_online(false);
  assert(!f.drivers->SetAvailability(kDriver, offline).driver().online());
  assert(f.ctx.geo->IndexedCount() == 1);

  const auto remaining = f.drivers->FindNearbyDrivers(kRider, nearby);
  assert(remaining.drivers_size() == 1);
  assert(remaining.drivers(0).driver_id() == kOtherDriver.id);

  nearby.set_radius_km(3);
  assert(f.drivers->FindNearbyDrivers(kRider, nearby).drivers_size() == 0);

  GetDriverRequest get;
  get.set_driver_id(kDriver.id);
  assert(!f.drivers->GetDriver(kRider, get).driver().online());
}

void TestAdminStatsAndBroadcast() {
  ServiceFixture f;
  f.OnlineDriver(kDriver.id, -33.8788, 151.2093);

  const auto stats = f.admin->GetStats(GetStatsRequest());
  assert(stats.instance_id() == "node-test");
  assert(stats.indexed_drivers() == 1);
  assert(stats.connections() == 0);

  const auto created = f.orders->CreateOrder(kRider, ServiceFixture::RideRequest());

  BroadcastOrderRequest req;
  req.set_order_id(created.order().id());
  f.admin->BroadcastOrder(req);

  AcceptOrderRequest accept;
  accept.set_order_id(created.order().id());
  f.orders->AcceptOrder(kDriver, accept);

  bool unavailable = false;
  try {
    f.admin->BroadcastOrder(req);
  } catch (const util::Conflict& e) {
    unavailable = e.code() == "ORDER_NO_LONGER_AVAILABLE";
  }
  assert(unavailable);
}

void TestAdminBroadcastSkipsDecliners() {
  ServiceFixture f;
  f.OnlineDriver(kDriver.id, -33.8788, 151.2093);
  f.OnlineDriver(kOtherDriver.id, -33.8700, 151.2093);

  auto decliner = std::make_shared<OfferInbox>();
  auto other    = std::make_shared<OfferInbox>();
  f.ctx.gateway->Connect(kDriver, decliner);
  f.ctx.gateway->Connect(kOtherDriver, other);

  const auto created = f.orders->CreateOrder(kRider, ServiceFixture::RideRequest());
  const auto id      = created.order().id();

  DeclineOrderRequest decline;
  decline.set_order_id(id);
  decline.set_reason("too far");
  f.orders->DeclineOrder(kDriver, decline);

  const int decliner_before = decliner->Offers();
  const int other_before    = other->Offers();

  BroadcastOrderRequest req;
  req.set_order_id(id);
  f.admin->BroadcastOrder(req);

  assert(decliner->Offers() == decliner_before);
  assert(other->Offers() == other_before + 1);
}

void TestAcceptDuringAdminBroadcast() {
  ServiceFixture f;
  f.OnlineDriver(kDriver.id, -33.8788, 151.2093);

  const auto created = f.orders->CreateOrder(kRider, ServiceFixture::RideRequest());
  const auto id      = created.order().id();

  // the driver accepts as soon as the broadcast offer lands
  auto inbox      = std::make_shared<OfferInbox>();
  bool accepted   = false;
  inbox->on_offer = [&](const std::string& order_id) {
    AcceptOrderRequest accept;
    accept.set_order_id(order_id);
    accepted = f.orders->AcceptOrder(kDriver, accept).order().driver_id() == kDriver.id;
  };
  f.ctx.gateway->Connect(kDriver, inbox);

  BroadcastOrderRequest req;
  req.set_order_id(id);
  f.admin->BroadcastOrder(req);

  assert(accepted);
  GetOrderRequest get;
  get.set_order_id(id);
  assert(f.orders->GetOrder(kRider, get).order().status() == ORDER_STATUS_DRIVER_ASSIGNED);
}

void TestObservedRpcPassesThroughWithoutTelemetry() {
  const auto value = service::ObserveRpc("Test.Value", &kRider, [] { return 42; });
  assert(value == 42);

  int calls = 0;
  service::ObserveRpc("Test.Void", nullptr, [&] { ++calls; });
  assert(calls == 1);

  bool rethrown = false;
  try {
    service::ObserveRpc("Test.Fails", &kDriver, []() -> int { throw util::OrderNotFound("o-404"); });
  } catch (const util::NotFound& e) {
    rethrown = e.code() == "ORDER_NOT_FOUND";
  }
  assert(rethrown);
}

} // namespace

int main() {
  TestRolesAreEnforced();
  TestOtpVisibleOnlyToRider();
  TestLifecycleThroughServices();
  TestHistoryPaging();
  TestDriverRegistrationDefaults();
  TestAvailabilityControlsIndex();
  TestAdminStatsAndBroadcast();
  TestAdminBroadcastSkipsDecliners();
  TestAcceptDuringAdminBroadcast();
  TestObservedRpcPassesThroughWithoutTelemetry();
  std::cout << "order_service_test: pass\n";
  return 0;
}
