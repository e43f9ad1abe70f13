#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "geo_math.hpp"

namespace dispatch::geo {

struct GeoHit {
  std::string driver_id;
  double      distance_km = 0;
  Coordinates position;
};

/*
  Fast-path spatial store (the cache tier).

  Implementations may block or throw on any call; GeoIndex bounds every
  call with a deadline and recovers from failures.
*/
class GeoBackend {
 public:
  virtual ~GeoBackend() = default;

  // Inserts or moves an entry. It disappears after ttl unless refreshed.
  virtual void Upsert(const std::string& driver_id, const Coordinates& position, double heading, std::chrono::milliseconds ttl) = 0;

  virtual void Remove(const std::string& driver_id) = 0;

  // Live entries within radius_km, nearest first. limit 0 = no limit.
  virtual std::vector<GeoHit> Radius(const Coordinates& center, double radius_km, uint32_t limit) = 0;

  virtual std::optional<Coordinates> Position(const std::string& driver_id) = 0;

  // Live entries.
  virtual size_t Size() = 0;
};

} // namespace dispatch::geo
