#pragma once

#include <map>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "dispatch/core/v1/types.pb.h"

namespace dispatch::engine {

enum class VehicleClass {
  kCar,
  kMotorcycle,
  kBicycle,
  kSmall,
  kMedium,
  kLarge,
};

const char*                 ToString(VehicleClass vehicle_class);
std::optional<VehicleClass> ParseVehicleClass(const std::string& code);

// RIDE classes are vehicles, DELIVERY classes are package sizes.
bool BelongsTo(VehicleClass vehicle_class, dispatch::core::v1::OrderType type);

struct FareRule {
  double base_fare    = 0;
  double per_km       = 0;
  double per_minute   = 0;
  double minimum_fare = 0;
};

struct FareQuote {
  double base_fare     = 0;
  double distance_fare = 0;
  double time_fare     = 0;
  double surge_fare    = 0;
  double total         = 0;
};

/*
  Fare rules keyed by VehicleClass. Starts from the built-in table;
  configured rows replace a class's rule wholesale.
*/
class FareTable {
 public:
  FareTable();
  explicit FareTable(const google::protobuf::RepeatedPtrField<dispatch::runtime::config::FareConfig>& overrides);

  // Empty code -> the type's default class (CAR, SMALL). Throws
  // UNKNOWN_VEHICLE_CLASS for unknown codes and for classes of the other type.
  VehicleClass Resolve(dispatch::core::v1::OrderType type, const std::string& code) const;

  const FareRule& Rule(VehicleClass vehicle_class) const;

  // max(base + per_km*d + per_minute*t, minimum) * surge, components
  // rounded to cents.
  FareQuote Quote(VehicleClass vehicle_class, double distance_km, int32_t duration_minutes, double surge_multiplier) const;

 private:
  std::map<VehicleClass, FareRule> rules_;
};

// Fewer than 3 candidates: 1.5, fewer than 5: 1.2, otherwise 1.0.
double SurgeMultiplier(size_t candidate_count);

} // namespace dispatch::engine
