#include "geo_math.hpp"

#include <algorithm>
#include <cmath>

namespace dispatch::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
  return degrees * (kPi / 180.0);
}

} // namespace

double HaversineKm(const Coordinates& from, const Coordinates& to) {
  const double d_lat = ToRadians(to.latitude - from.latitude);
  const double d_lng = ToRadians(to.longitude - from.longitude);

  const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                   std::cos(ToRadians(from.latitude)) * std::cos(ToRadians(to.latitude)) * std::sin(d_lng / 2) * std::sin(d_lng / 2);

  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusKm * c;
}

bool IsValidCoordinate(const Coordinates& point) {
  return std::isfinite(point.latitude) && std::isfinite(point.longitude) && point.latitude >= -90.0 && point.latitude <= 90.0 &&
         point.longitude >= -180.0 && point.longitude <= 180.0;
}

BoundingBox BoundingBoxAround(const Coordinates& center, double radius_km) {
  const double lat_delta = radius_km / kKmPerDegree;

  BoundingBox box;
  box.min_lat = std::max(center.latitude - lat_delta, -90.0);
  box.max_lat = std::min(center.latitude + lat_delta, 90.0);
  box.min_lng = -180.0;
  box.max_lng = 180.0;
  if (box.min_lat <= -90.0 || box.max_lat >= 90.0) {
    return box;
  }

  const double lng_delta = radius_km / (kKmPerDegree * std::cos(ToRadians(center.latitude)));
  if (lng_delta < 180.0) {
    box.min_lng = center.longitude - lng_delta;
    box.max_lng = center.longitude + lng_delta;
  }
  return box;
}

std::vector<BoundingBox> SplitAtAntimeridian(const BoundingBox& box) {
  if (box.min_lng < -180.0) {
    BoundingBox east = box;
    BoundingBox west = box;
    east.min_lng     = box.min_lng + 360.0;
    east.max_lng     = 180.0;
    west.min_lng     = -180.0;
    return {east, west};
  }
  if (box.max_lng > 180.0) {
    BoundingBox east = box;
    BoundingBox west = box;
    east.max_lng     = 180.0;
    west.min_lng     = -180.0;
    west.max_lng     = box.max_lng - 360.0;
    return {east, west};
  }
  return {box};
}

bool Contains(const BoundingBox& box, const Coordinates& point) {
  for (const auto& part : SplitAtAntimeridian(box)) {
    if (point.latitude >= part.min_lat && point.latitude <= part.max_lat && point.longitude >= part.min_lng && point.longitude <= part.max_lng) {
      return true;
    }
  }
  return false;
}

RouteEstimate EstimateRoute(const Coordinates& from, const Coordinates& to, double road_factor, double speed_kmh) {
  RouteEstimate route;
  route.direct_km = HaversineKm(from, to);

  route.road_km          = RoundTo(route.direct_km * road_factor, 1);
  route.duration_minutes = TravelMinutes(route.direct_km, road_factor, speed_kmh);
  return route;
}

int32_t EtaMinutes(const Coordinates& from, const Coordinates& to, double road_factor, double speed_kmh) {
  return EstimateRoute(from, to, road_factor, speed_kmh).duration_minutes;
}

int32_t TravelMinutes(double direct_km, double road_factor, double speed_kmh) {
  return static_cast<int32_t>(std::ceil(direct_km * road_factor / speed_kmh * 60.0));
}

double RoundTo(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

} // namespace dispatch::geo
