#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace dispatch::service {

using namespace dispatch::core::v1;

namespace {

void FillPlace(Place* place, double lat, double lng, const std::string& address) {
  place->mutable_point()->set_latitude(lat);
  place->mutable_point()->set_longitude(lng);
  place->set_address(address);
}

} // namespace

Order ToProto(const db::model::OrderRecord& order, const std::string& viewer_id) {
  Order out;
  out.set_id(order.id);
  out.set_type(order.type);
  out.set_status(order.status);
  out.set_rider_id(order.rider_id);
  out.set_driver_id(order.driver_id);
  FillPlace(out.mutable_pickup(), order.pickup_lat, order.pickup_lng, order.pickup_address);
  FillPlace(out.mutable_dropoff(), order.dropoff_lat, order.dropoff_lng, order.dropoff_address);
  out.set_vehicle_class(order.vehicle_class);
  out.set_distance_km(order.distance_km);
  out.set_duration_minutes(order.duration_minutes);
  out.set_estimated_fare(order.estimated_fare);
  out.set_final_fare(order.final_fare);
  out.set_surge_multiplier(order.surge_multiplier);
  if (!viewer_id.empty() && viewer_id == order.rider_id) {
    out.set_otp(order.otp);
  }

  if (order.type == ORDER_TYPE_DELIVERY) {
    auto* delivery = out.mutable_delivery();
    delivery->set_recipient_name(order.recipient_name);
    delivery->set_recipient_phone(order.recipient_phone);
    delivery->set_package_description(order.package_description);
  }

  if (order.requested_at_ms) *out.mutable_requested_at() = util::MillisToProto(order.requested_at_ms);
  if (order.accepted_at_ms) *out.mutable_accepted_at() = util::MillisToProto(order.accepted_at_ms);
  if (order.started_at_ms) *out.mutable_started_at() = util::MillisToProto(order.started_at_ms);
  if (order.completed_at_ms) *out.mutable_completed_at() = util::MillisToProto(order.completed_at_ms);
  if (order.cancelled_at_ms) *out.mutable_cancelled_at() = util::MillisToProto(order.cancelled_at_ms);
  out.set_cancelled_by(order.cancelled_by);
  out.set_cancellation_reason(order.cancellation_reason);
  return out;
}

VehicleInfo VehicleOf(const db::model::DriverRecord& driver) {
  VehicleInfo vehicle;
  vehicle.set_vehicle_class(driver.vehicle_class);
  vehicle.set_plate(driver.plate);
  vehicle.set_model(driver.model);
  vehicle.set_color(driver.color);
  return vehicle;
}

Driver ToProto(const db::model::DriverRecord& driver) {
  Driver out;
  out.set_id(driver.id);
  out.set_online(driver.online);
  out.set_availability(driver.availability);
  *out.mutable_vehicle() = VehicleOf(driver);
  out.set_rating(driver.rating);
  out.set_total_rides(driver.total_rides);
  out.set_total_deliveries(driver.total_deliveries);
  if (driver.has_position) {
    *out.mutable_position() = ToProto(geo::Coordinates{driver.last_lat, driver.last_lng});
    out.set_heading(driver.heading);
  }
  return out;
}

OrderEvent ToProto(const db::model::OrderEventRecord& event) {
  OrderEvent out;
  out.set_order_id(event.order_id);
  out.set_type(event.type);
  out.set_actor_id(event.actor_id);
  if (event.has_position) {
    *out.mutable_position() = ToProto(geo::Coordinates{event.lat, event.lng});
  }
  if (event.at_ms) *out.mutable_at() = util::MillisToProto(event.at_ms);
  return out;
}

GeoPoint ToProto(const geo::Coordinates& point) {
  GeoPoint out;
  out.set_latitude(point.latitude);
  out.set_longitude(point.longitude);
  return out;
}

geo::Coordinates FromProto(const GeoPoint& point) {
  return {point.latitude(), point.longitude()};
}

} // namespace dispatch::service
