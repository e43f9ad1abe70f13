#pragma once

#include <mutex>
#include <set>
#include <unordered_map>

#include "geo_backend.hpp"

namespace dispatch::geo {

/*
  In-process sorted geohash index.

  Entries are ordered by their 52-bit geohash score, so a radius query
  scans at most nine contiguous score ranges before the exact distance
  filter. Expired entries are skipped by reads and purged lazily.
*/
class MemoryGeoBackend final : public GeoBackend {
 public:
  void                       Upsert(const std::string& driver_id, const Coordinates& position, double heading, std::chrono::milliseconds ttl) override;
  void                       Remove(const std::string& driver_id) override;
  std::vector<GeoHit>        Radius(const Coordinates& center, double radius_km, uint32_t limit) override;
  std::optional<Coordinates> Position(const std::string& driver_id) override;
  size_t                     Size() override;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    uint64_t                score = 0;
    Coordinates             position;
    double                  heading = 0;
    SteadyClock::time_point expires_at;
  };

  void EraseLocked(const std::string& driver_id);
  void PurgeExpiredLocked(SteadyClock::time_point now);

  std::mutex                                                mutex_;
  std::unordered_map<std::string, Entry>                    entries_;
  std::set<std::pair<uint64_t, std::string>>                by_score_;
  std::set<std::pair<SteadyClock::time_point, std::string>> by_expiry_;
};

} // namespace dispatch::geo
