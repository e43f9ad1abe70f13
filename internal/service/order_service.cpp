#include "order_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/engine/dispatch_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace dispatch::service {

using namespace dispatch::core::v1;
using namespace dispatch::services::v1;

namespace {

constexpr uint32_t kDefaultPageSize = 20;
constexpr uint32_t kMaxPageSize     = 100;

void RequireId(const std::string& id, const char* what) {
  if (id.empty()) {
    throw util::InvalidInput(std::string(what) + " is required");
  }
}

geo::Coordinates RequirePoint(bool present, const GeoPoint& point, const char* what) {
  if (!present) {
    throw util::InvalidInput(std::string(what) + " is required");
  }
  return FromProto(point);
}

// Parties may always read an order; drivers may also read orders still
// looking for a driver, which is what an offer points them at.
void RequireVisible(const db::model::OrderRecord& order, const auth::Identity& caller) {
  if (caller.id == order.rider_id || caller.id == order.driver_id) {
    return;
  }
  if (caller.role == auth::Role::kDriver && order.status == ORDER_STATUS_PENDING) {
    return;
  }
  throw util::Forbidden("order " + order.id + " does not belong to the caller");
}

} // namespace

OrderService::OrderService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EstimateResponse OrderService::Estimate(const auth::Identity& caller, const EstimateRequest& req) {
  return ObserveRpc("OrderService.Estimate", &caller, [&] {
    engine::EstimateInput input;
    input.type          = req.type();
    input.pickup        = RequirePoint(req.has_pickup(), req.pickup(), "pickup");
    input.dropoff       = RequirePoint(req.has_dropoff(), req.dropoff(), "dropoff");
    input.vehicle_class = req.vehicle_class();

    const auto estimate = ctx_.engine->Estimate(input);

    EstimateResponse resp;
    resp.set_distance_km(estimate.distance_km);
    resp.set_duration_minutes(estimate.duration_minutes);
    resp.set_fare(estimate.fare.total);
    resp.mutable_breakdown()->set_base_fare(estimate.fare.base_fare);
    resp.mutable_breakdown()->set_distance_fare(estimate.fare.distance_fare);
    resp.mutable_breakdown()->set_time_fare(estimate.fare.time_fare);
    resp.mutable_breakdown()->set_surge_fare(estimate.fare.surge_fare);
    resp.set_surge_multiplier(estimate.surge_multiplier);
    resp.set_nearby_drivers(estimate.nearby_drivers);
    resp.set_estimated_pickup_minutes(estimate.pickup_minutes);
    resp.set_vehicle_class(engine::ToString(estimate.vehicle_class));
    return resp;
  });
}

CreateOrderResponse OrderService::CreateOrder(const auth::Identity& caller, const CreateOrderRequest& req) {
  return ObserveRpc("OrderService.CreateOrder", &caller, [&] {
    RequireRole(caller, auth::Role::kRider, "create an order");

    engine::NewOrder order;
    order.rider_id        = caller.id;
    order.type            = req.type();
    order.pickup          = RequirePoint(req.pickup().has_point(), req.pickup().point(), "pickup");
    order.pickup_address  = req.pickup().address();
    order.dropoff         = RequirePoint(req.dropoff().has_point(), req.dropoff().point(), "dropoff");
    order.dropoff_address = req.dropoff().address();
    order.vehicle_class   = req.vehicle_class();
    if (req.has_delivery()) {
      order.recipient_name      = req.delivery().recipient_name();
      order.recipient_phone     = req.delivery().recipient_phone();
      order.package_description = req.delivery().package_description();
    }

    const auto created = ctx_.engine->CreateOrder(order);

    CreateOrderResponse resp;
    *resp.mutable_order() = ToProto(created.order, caller.id);
    resp.set_offered_drivers(created.offered_drivers);
    return resp;
  });
}

AcceptOrderResponse OrderService::AcceptOrder(const auth::Identity& caller, const AcceptOrderRequest& req) {
  return ObserveRpc("OrderService.AcceptOrder", &caller, [&] {
    RequireRole(caller, auth::Role::kDriver, "accept an order");
    RequireId(req.order_id(), "order_id");

    AcceptOrderResponse resp;
    *resp.mutable_order() = ToProto(ctx_.engine->AcceptOrder(req.order_id(), caller.id), caller.id);
    return resp;
  });
}

void OrderService::DeclineOrder(const auth::Identity& caller, const DeclineOrderRequest& req) {
  ObserveRpc("OrderService.DeclineOrder", &caller, [&] {
    RequireRole(caller, auth::Role::kDriver, "decline an order");
    RequireId(req.order_id(), "order_id");
    ctx_.engine->DeclineOrder(req.order_id(), caller.id, req.reason());
  });
}

UpdateOrderStatusResponse OrderService::UpdateOrderStatus(const auth::Identity& caller, const UpdateOrderStatusRequest& req) {
  return ObserveRpc("OrderService.UpdateOrderStatus", &caller, [&] {
    RequireId(req.order_id(), "order_id");
    if (req.status() != ORDER_STATUS_CANCELLED) {
      RequireRole(caller, auth::Role::kDriver, "advance an order");
    }

    engine::StatusChange change;
    change.order_id = req.order_id();
    change.actor_id = caller.id;
    change.status   = req.status();
    change.otp      = req.otp();
    if (req.has_position()) {
      change.position = FromProto(req.position());
    }

    UpdateOrderStatusResponse resp;
    *resp.mutable_order() = ToProto(ctx_.engine->UpdateStatus(change), caller.id);
    return resp;
  });
}

CancelOrderResponse OrderService::CancelOrder(const auth::Identity& caller, const CancelOrderRequest& req) {
  return ObserveRpc("OrderService.CancelOrder", &caller, [&] {
    RequireId(req.order_id(), "order_id");

    CancelOrderResponse resp;
    *resp.mutable_order() = ToProto(ctx_.engine->CancelOrder(req.order_id(), caller.id, req.reason()), caller.id);
    return resp;
  });
}

GetOrderResponse OrderService::GetOrder(const auth::Identity& caller, const GetOrderRequest& req) {
  return ObserveRpc("OrderService.GetOrder", &caller, [&] {
    RequireId(req.order_id(), "order_id");

    auto tx    = ctx_.repository->Begin();
    auto order = ctx_.repository->GetOrder(*tx, req.order_id());
    if (!order) {
      throw util::OrderNotFound(req.order_id());
    }
    RequireVisible(*order, caller);

    GetOrderResponse resp;
    *resp.mutable_order() = ToProto(*order, caller.id);
    return resp;
  });
}

GetActiveOrderResponse OrderService::GetActiveOrder(const auth::Identity& caller, const GetActiveOrderRequest&) {
  return ObserveRpc("OrderService.GetActiveOrder", &caller, [&] {
    auto tx    = ctx_.repository->Begin();
    auto order = caller.role == auth::Role::kRider ? ctx_.repository->FindActiveOrderForRider(*tx, caller.id)
                                                   : ctx_.repository->FindActiveOrderForDriver(*tx, caller.id);

    GetActiveOrderResponse resp;
    resp.set_found(order.has_value());
    if (order) {
      *resp.mutable_order() = ToProto(*order, caller.id);
    }
    return resp;
  });
}

ListOrderHistoryResponse OrderService::ListOrderHistory(const auth::Identity& caller, const ListOrderHistoryRequest& req) {
  return ObserveRpc("OrderService.ListOrderHistory", &caller, [&] {
    const uint32_t page      = std::max<uint32_t>(req.page(), 1);
    const uint32_t page_size = req.page_size() == 0 ? kDefaultPageSize : std::min(req.page_size(), kMaxPageSize);

    auto       tx     = ctx_.repository->Begin();
    const auto orders = ctx_.repository->ListOrdersForParticipant(*tx, caller.id, (page - 1) * page_size, page_size);

    ListOrderHistoryResponse resp;
    for (const auto& order : orders) {
      *resp.add_orders() = ToProto(order, caller.id);
    }
    resp.set_total(ctx_.repository->CountOrdersForParticipant(*tx, caller.id));
    resp.set_page(page);
    resp.set_page_size(page_size);
    return resp;
  });
}

ListOrderEventsResponse OrderService::ListOrderEvents(const auth::Identity& caller, const ListOrderEventsRequest& req) {
  return ObserveRpc("OrderService.ListOrderEvents", &caller, [&] {
    RequireId(req.order_id(), "order_id");

    auto tx    = ctx_.repository->Begin();
    auto order = ctx_.repository->GetOrder(*tx, req.order_id());
    if (!order) {
      throw util::OrderNotFound(req.order_id());
    }
    RequireVisible(*order, caller);

    ListOrderEventsResponse resp;
    for (const auto& event : ctx_.repository->ListOrderEvents(*tx, req.order_id())) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

void OrderService::RateOrder(const auth::Identity& caller, const RateOrderRequest& req) {
  ObserveRpc("OrderService.RateOrder", &caller, [&] {
    RequireId(req.order_id(), "order_id");
    ctx_.engine->RateOrder(req.order_id(), caller.id, static_cast<int32_t>(req.stars()), req.comment());
  });
}

} // namespace dispatch::service
