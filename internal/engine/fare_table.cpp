#include "fare_table.hpp"

#include <algorithm>

#include "internal/geo/geo_math.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::engine {

using dispatch::core::v1::ORDER_TYPE_DELIVERY;
using dispatch::core::v1::ORDER_TYPE_RIDE;
using dispatch::core::v1::OrderType;

const char* ToString(VehicleClass vehicle_class) {
  switch (vehicle_class) {
    case VehicleClass::kCar:
      return "CAR";
    case VehicleClass::kMotorcycle:
      return "MOTORCYCLE";
    case VehicleClass::kBicycle:
      return "BICYCLE";
    case VehicleClass::kSmall:
      return "SMALL";
    case VehicleClass::kMedium:
      return "MEDIUM";
    case VehicleClass::kLarge:
      return "LARGE";
  }
  return "UNKNOWN";
}

std::optional<VehicleClass> ParseVehicleClass(const std::string& code) {
  std::string upper = code;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "CAR") return VehicleClass::kCar;
  if (upper == "MOTORCYCLE") return VehicleClass::kMotorcycle;
  if (upper == "BICYCLE") return VehicleClass::kBicycle;
  if (upper == "SMALL") return VehicleClass::kSmall;
  if (upper == "MEDIUM") return VehicleClass::kMedium;
  if (upper == "LARGE") return VehicleClass::kLarge;
  return std::nullopt;
}

bool BelongsTo(VehicleClass vehicle_class, OrderType type) {
  switch (vehicle_class) {
    case VehicleClass::kCar:
    case VehicleClass::kMotorcycle:
    case VehicleClass::kBicycle:
      return type == ORDER_TYPE_RIDE;
    case VehicleClass::kSmall:
    case VehicleClass::kMedium:
    case VehicleClass::kLarge:
      return type == ORDER_TYPE_DELIVERY;
  }
  return false;
}

FareTable::FareTable() {
  rules_[VehicleClass::kCar]        = {2.50, 1.20, 0.20, 5.00};
  rules_[VehicleClass::kMotorcycle] = {1.50, 0.80, 0.15, 3.00};
  rules_[VehicleClass::kBicycle]    = {1.00, 0.50, 0.10, 2.00};
  rules_[VehicleClass::kSmall]      = {3.00, 1.00, 0.10, 5.00};
  rules_[VehicleClass::kMedium]     = {5.00, 1.50, 0.15, 8.00};
  rules_[VehicleClass::kLarge]      = {8.00, 2.00, 0.20, 12.00};
}

FareTable::FareTable(const google::protobuf::RepeatedPtrField<dispatch::runtime::config::FareConfig>& overrides) : FareTable() {
  for (const auto& row : overrides) {
    const auto vehicle_class = ParseVehicleClass(row.vehicle_class());
    if (!vehicle_class) {
      throw util::UnknownVehicleClass(row.vehicle_class());
    }
    rules_[*vehicle_class] = {row.base_fare(), row.per_km(), row.per_minute(), row.minimum_fare()};
  }
}

VehicleClass FareTable::Resolve(OrderType type, const std::string& code) const {
  if (type != ORDER_TYPE_RIDE && type != ORDER_TYPE_DELIVERY) {
    throw util::InvalidInput("order type is required");
  }

  if (code.empty()) {
    return type == ORDER_TYPE_RIDE ? VehicleClass::kCar : VehicleClass::kSmall;
  }

  const auto vehicle_class = ParseVehicleClass(code);
  if (!vehicle_class || !BelongsTo(*vehicle_class, type)) {
    throw util::UnknownVehicleClass(code);
  }
  return *vehicle_class;
}

const FareRule& FareTable::Rule(VehicleClass vehicle_class) const {
  return rules_.at(vehicle_class);
}

FareQuote FareTable::Quote(VehicleClass vehicle_class, double distance_km, int32_t duration_minutes, double surge_multiplier) const {
  const auto& rule = Rule(vehicle_class);

  const double distance_fare = distance_km * rule.per_km;
  const double time_fare     = duration_minutes * rule.per_minute;
  const double subtotal      = std::max(rule.base_fare + distance_fare + time_fare, rule.minimum_fare);
  const double total         = subtotal * surge_multiplier;

  FareQuote quote;
  quote.base_fare     = rule.base_fare;
  quote.distance_fare = geo::RoundTo(distance_fare, 2);
  quote.time_fare     = geo::RoundTo(time_fare, 2);
  quote.surge_fare    = geo::RoundTo(total - subtotal, 2);
  quote.total         = geo::RoundTo(total, 2);
  return quote;
}

double SurgeMultiplier(size_t candidate_count) {
  if (candidate_count < 3) return 1.5;
  if (candidate_count < 5) return 1.2;
  return 1.0;
}

} // namespace dispatch::engine
