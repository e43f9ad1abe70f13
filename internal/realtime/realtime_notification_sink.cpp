#include "realtime_notification_sink.hpp"

#include "internal/geo/geo_math.hpp"
#include "realtime_gateway.hpp"

namespace dispatch::realtime {

using namespace dispatch::core::v1;

namespace {

void FillPlace(Place* place, double lat, double lng, const std::string& address) {
  place->mutable_point()->set_latitude(lat);
  place->mutable_point()->set_longitude(lng);
  place->set_address(address);
}

} // namespace

dispatch::realtime::v1::ServerMessage OfferMessage(const db::model::OrderRecord& order, uint32_t attempt) {
  dispatch::realtime::v1::ServerMessage message;
  auto*                                 offer = message.mutable_new_order_request();
  offer->set_order_id(order.id);
  offer->set_type(order.type);
  FillPlace(offer->mutable_pickup(), order.pickup_lat, order.pickup_lng, order.pickup_address);
  FillPlace(offer->mutable_dropoff(), order.dropoff_lat, order.dropoff_lng, order.dropoff_address);
  offer->set_fare(order.estimated_fare);
  offer->set_distance_km(order.distance_km);
  offer->set_duration_minutes(order.duration_minutes);
  offer->set_attempt(attempt);
  offer->set_vehicle_class(order.vehicle_class);
  return message;
}

dispatch::realtime::v1::ServerMessage OrderUpdateMessage(const engine::OrderChange& change) {
  dispatch::realtime::v1::ServerMessage message;
  auto*                                 update = message.mutable_order_update();
  update->set_order_id(change.order.id);
  update->set_status(change.order.status);
  update->set_fare(change.order.final_fare > 0 ? change.order.final_fare : change.order.estimated_fare);
  update->set_eta_minutes(change.eta_minutes);

  if (change.driver) {
    update->set_driver_id(change.driver->id);
    update->set_driver_rating(change.driver->rating);
    auto* vehicle = update->mutable_vehicle();
    vehicle->set_vehicle_class(change.driver->vehicle_class);
    vehicle->set_plate(change.driver->plate);
    vehicle->set_model(change.driver->model);
    vehicle->set_color(change.driver->color);
  }

  if (change.order.status == ORDER_STATUS_CANCELLED) {
    update->set_cancelled_by(change.order.cancelled_by);
    update->set_reason(change.order.cancellation_reason);
  }
  return message;
}

RealtimeNotificationSink::RealtimeNotificationSink(std::shared_ptr<RealtimeGateway> gateway) : gateway_(std::move(gateway)) {
}

void RealtimeNotificationSink::OnOffer(const db::model::OrderRecord& order, const engine::Candidate& candidate, uint32_t attempt) {
  auto  message = OfferMessage(order, attempt);
  auto* offer   = message.mutable_new_order_request();
  offer->set_distance_to_pickup_km(geo::RoundTo(candidate.distance_km, 2));
  offer->set_eta_to_pickup_minutes(candidate.eta_minutes);
  gateway_->SendTo(candidate.driver_id, std::move(message));
}

void RealtimeNotificationSink::OnStatusChanged(const engine::OrderChange& change) {
  const auto  message = OrderUpdateMessage(change);
  const auto& order   = change.order;

  switch (order.status) {
    case ORDER_STATUS_DRIVER_ASSIGNED:
      gateway_->SendTo(order.rider_id, message);
      if (change.driver) gateway_->SendTo(change.driver->id, message);
      break;
    case ORDER_STATUS_CANCELLED:
      if (order.cancelled_by == order.rider_id) {
        if (change.driver) gateway_->SendTo(change.driver->id, message);
      } else {
        gateway_->SendTo(order.rider_id, message);
      }
      break;
    default:
      gateway_->SendTo(order.rider_id, message);
      break;
  }
}

} // namespace dispatch::realtime
