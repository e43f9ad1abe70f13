#pragma once

#include <string>

#include "dispatch/core/v1/types.pb.h"
#include "internal/db/model/driver_record.hpp"
#include "internal/db/model/order_event_record.hpp"
#include "internal/db/model/order_record.hpp"
#include "internal/geo/geo_math.hpp"

namespace dispatch::service {

// The OTP is only filled in when viewer_id is the order's rider.
dispatch::core::v1::Order ToProto(const db::model::OrderRecord& order, const std::string& viewer_id);

dispatch::core::v1::Driver      ToProto(const db::model::DriverRecord& driver);
dispatch::core::v1::VehicleInfo VehicleOf(const db::model::DriverRecord& driver);
dispatch::core::v1::OrderEvent  ToProto(const db::model::OrderEventRecord& event);

dispatch::core::v1::GeoPoint ToProto(const geo::Coordinates& point);
geo::Coordinates             FromProto(const dispatch::core::v1::GeoPoint& point);

} // namespace dispatch::service
