#include "memory_geo_backend.hpp"

#include <algorithm>

#include "geohash.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::geo {

void MemoryGeoBackend::Upsert(const std::string& driver_id, const Coordinates& position, double heading, std::chrono::milliseconds ttl) {
  if (!IsValidCoordinate(position)) {
    throw util::InvalidInput("geo upsert: coordinate out of range");
  }

  std::lock_guard lock(mutex_);
  EraseLocked(driver_id);

  Entry entry;
  entry.score      = Score(position);
  entry.position   = position;
  entry.heading    = heading;
  entry.expires_at = SteadyClock::now() + ttl;

  by_score_.emplace(entry.score, driver_id);
  by_expiry_.emplace(entry.expires_at, driver_id);
  entries_[driver_id] = entry;
}

void MemoryGeoBackend::Remove(const std::string& driver_id) {
  std::lock_guard lock(mutex_);
  EraseLocked(driver_id);
}

std::vector<GeoHit> MemoryGeoBackend::Radius(const Coordinates& center, double radius_km, uint32_t limit) {
  if (!IsValidCoordinate(center) || radius_km <= 0) {
    return {};
  }

  std::lock_guard lock(mutex_);
  const auto      now = SteadyClock::now();
  PurgeExpiredLocked(now);

  std::vector<GeoHit> hits;
  for (const auto& cell : CoveringCells(center, radius_km)) {
    const auto [min, max] = ScoreRange(cell);

    auto it  = by_score_.lower_bound({min, std::string()});
    auto end = by_score_.lower_bound({max, std::string()});
    for (; it != end; ++it) {
      const auto& entry    = entries_.at(it->second);
      const auto  distance = HaversineKm(center, entry.position);
      if (distance <= radius_km) {
        hits.push_back({it->second, distance, entry.position});
      }
    }
  }

  std::sort(hits.begin(), hits.end(), [](const GeoHit& a, const GeoHit& b) {
    if (a.distance_km != b.distance_km) return a.distance_km < b.distance_km;
    return a.driver_id < b.driver_id;
  });

  if (limit && hits.size() > limit) hits.resize(limit);
  return hits;
}

std::optional<Coordinates> MemoryGeoBackend::Position(const std::string& driver_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(driver_id);
  if (it == entries_.end() || it->second.expires_at <= SteadyClock::now()) {
    return std::nullopt;
  }
  return it->second.position;
}

size_t MemoryGeoBackend::Size() {
  std::lock_guard lock(mutex_);
  PurgeExpiredLocked(SteadyClock::now());
  return entries_.size();
}

void MemoryGeoBackend::EraseLocked(const std::string& driver_id) {
  auto it = entries_.find(driver_id);
  if (it == entries_.end()) return;

  by_score_.erase({it->second.score, driver_id});
  by_expiry_.erase({it->second.expires_at, driver_id});
  entries_.erase(it);
}

void MemoryGeoBackend::PurgeExpiredLocked(SteadyClock::time_point now) {
  while (!by_expiry_.empty() && by_expiry_.begin()->first <= now) {
    const std::string driver_id = by_expiry_.begin()->second;
    EraseLocked(driver_id);
  }
}

} // namespace dispatch::geo
