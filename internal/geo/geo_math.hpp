#pragma once

#include <cstdint>
#include <vector>

namespace dispatch::geo {

/*
  Shared distance model.

  HaversineKm is the only great-circle formula in the process. Estimation,
  candidate filtering, ranking and movement suppression all call it so
  that two components never disagree about whether a driver is in range.
*/

inline constexpr double kEarthRadiusKm = 6371.0;
inline constexpr double kKmPerDegree   = 111.0;

struct Coordinates {
  double latitude  = 0;
  double longitude = 0;
};

struct BoundingBox {
  double min_lat = 0;
  double max_lat = 0;
  double min_lng = 0;
  double max_lng = 0;
};

struct RouteEstimate {
  double  direct_km        = 0;
  double  road_km          = 0; // rounded to 0.1 km
  int32_t duration_minutes = 0;
};

double HaversineKm(const Coordinates& from, const Coordinates& to);

bool IsValidCoordinate(const Coordinates& point);

// +-radius/111 degrees of latitude clamped to the poles, longitude widened
// by 1/cos(latitude). A box touching a pole spans every longitude. The
// longitude range may run past +-180.
BoundingBox BoundingBoxAround(const Coordinates& center, double radius_km);

// One box, or two when the longitude range crosses the antimeridian.
std::vector<BoundingBox> SplitAtAntimeridian(const BoundingBox& box);

bool Contains(const BoundingBox& box, const Coordinates& point);

// Straight line times road_factor, driven at speed_kmh.
RouteEstimate EstimateRoute(const Coordinates& from, const Coordinates& to, double road_factor, double speed_kmh);

int32_t EtaMinutes(const Coordinates& from, const Coordinates& to, double road_factor, double speed_kmh);

// Minutes to drive a straight-line distance, rounded up.
int32_t TravelMinutes(double direct_km, double road_factor, double speed_kmh);

double RoundTo(double value, int decimals);

} // namespace dispatch::geo
