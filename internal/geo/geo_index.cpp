#include "geo_index.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <unordered_set>

#include "internal/async/task_worker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::geo {

using dispatch::observability::DoubleField;
using dispatch::observability::StringField;

namespace {

// Waits for a worker result or throws ServiceDegraded at the deadline.
template <typename T>
T AwaitWithin(std::future<T>& fut, uint32_t timeout_ms, const char* op) {
  if (fut.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
    throw util::ServiceDegraded(std::string("geo ") + op + " timed out");
  }
  return fut.get();
}

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

GeoIndex::GeoIndex(std::shared_ptr<GeoBackend> primary, std::shared_ptr<db::Repository> repository, std::shared_ptr<async::TaskWorker> worker,
                   GeoIndexOptions options)
    : primary_(std::move(primary)), repository_(std::move(repository)), worker_(std::move(worker)), options_(options) {
}

void GeoIndex::Upsert(const std::string& driver_id, const Coordinates& position, double heading) {
  try {
    auto       backend = primary_;
    const auto ttl     = std::chrono::milliseconds(options_.entry_ttl_ms);
    auto       fut     = worker_->Submit([backend, driver_id, position, heading, ttl] { backend->Upsert(driver_id, position, heading, ttl); });
    AwaitWithin(fut, options_.upsert_timeout_ms, "upsert");
    MarkPrimary(true);
  } catch (const std::exception& e) {
    MarkPrimary(false);
    DISPATCH_LOG_WARN("geo upsert failed", {StringField("driver_id", driver_id), StringField("error", e.what())});
  }
}

void GeoIndex::Remove(const std::string& driver_id) {
  try {
    auto backend = primary_;
    auto fut     = worker_->Submit([backend, driver_id] { backend->Remove(driver_id); });
    AwaitWithin(fut, options_.upsert_timeout_ms, "remove");
    MarkPrimary(true);
  } catch (const std::exception& e) {
    MarkPrimary(false);
    DISPATCH_LOG_WARN("geo remove failed", {StringField("driver_id", driver_id), StringField("error", e.what())});
  }
}

std::vector<GeoHit> GeoIndex::Query(const Coordinates& center, double radius_km, uint32_t limit) {
  if (!IsValidCoordinate(center) || radius_km <= 0) {
    return {};
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto backend = primary_;
    auto fut     = worker_->Submit([backend, center, radius_km, limit] { return backend->Radius(center, radius_km, limit); });
    auto hits    = AwaitWithin(fut, options_.query_timeout_ms, "query");
    MarkPrimary(true);
    observability::Metrics::Instance().ObserveGeoQueryMs("primary", ElapsedMs(started_at));
    if (!hits.empty()) {
      return hits;
    }
    // Entries of online drivers that stopped moving can lapse before the
    // drivers go offline; the store still knows where they are.
    DISPATCH_LOG_DEBUG("geo primary query empty, checking store", {DoubleField("radius_km", radius_km)});
  } catch (const std::exception& e) {
    MarkPrimary(false);
    DISPATCH_LOG_WARN("geo primary query failed, using store fallback", {StringField("error", e.what()), DoubleField("radius_km", radius_km)});
  }

  const auto fallback_started_at = std::chrono::steady_clock::now();
  try {
    auto hits = QueryFallback(center, radius_km, limit);
    observability::Metrics::Instance().ObserveGeoQueryMs("fallback", ElapsedMs(fallback_started_at));
    return hits;
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("geo fallback query failed", {StringField("error", e.what())});
    return {};
  }
}

std::optional<double> GeoIndex::DistanceTo(const std::string& driver_id, const Coordinates& point) {
  std::optional<Coordinates> position;
  try {
    auto backend = primary_;
    auto fut     = worker_->Submit([backend, driver_id] { return backend->Position(driver_id); });
    position     = AwaitWithin(fut, options_.query_timeout_ms, "position");
    MarkPrimary(true);
  } catch (const std::exception& e) {
    MarkPrimary(false);
    DISPATCH_LOG_WARN("geo position lookup failed", {StringField("driver_id", driver_id), StringField("error", e.what())});
  }

  if (!position) {
    try {
      position = StoredPosition(driver_id);
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("stored position lookup failed", {StringField("driver_id", driver_id), StringField("error", e.what())});
    }
  }

  if (!position) return std::nullopt;
  return HaversineKm(*position, point);
}

bool GeoIndex::PrimaryHealthy() const {
  return primary_healthy_.load();
}

size_t GeoIndex::IndexedCount() {
  try {
    auto backend = primary_;
    auto fut     = worker_->Submit([backend] { return backend->Size(); });
    return AwaitWithin(fut, options_.query_timeout_ms, "size");
  } catch (const std::exception& e) {
    DISPATCH_LOG_WARN("geo size failed", {StringField("error", e.what())});
    return 0;
  }
}

std::vector<GeoHit> GeoIndex::QueryFallback(const Coordinates& center, double radius_km, uint32_t limit) {
  std::vector<db::model::DriverRecord> drivers;
  {
    auto tx = repository_->Begin();
    for (const auto& box : SplitAtAntimeridian(BoundingBoxAround(center, radius_km))) {
      auto part = repository_->ListOnlineDriversInBox(*tx, box.min_lat, box.max_lat, box.min_lng, box.max_lng);
      drivers.insert(drivers.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    tx->Commit();
  }

  std::unordered_set<std::string> seen;
  std::vector<GeoHit>             hits;
  for (const auto& driver : drivers) {
    if (!seen.insert(driver.id).second) continue;
    const Coordinates position{driver.last_lat, driver.last_lng};
    const double      distance = HaversineKm(center, position);
    if (distance <= radius_km) {
      hits.push_back({driver.id, distance, position});
    }
  }

  std::sort(hits.begin(), hits.end(), [](const GeoHit& a, const GeoHit& b) {
    if (a.distance_km != b.distance_km) return a.distance_km < b.distance_km;
    return a.driver_id < b.driver_id;
  });

  if (limit && hits.size() > limit) hits.resize(limit);
  return hits;
}

std::optional<Coordinates> GeoIndex::StoredPosition(const std::string& driver_id) {
  auto tx     = repository_->Begin();
  auto driver = repository_->GetDriver(*tx, driver_id);
  tx->Commit();

  if (!driver || !driver->has_position) return std::nullopt;
  return Coordinates{driver->last_lat, driver->last_lng};
}

void GeoIndex::MarkPrimary(bool healthy) {
  const bool was = primary_healthy_.exchange(healthy);
  if (was && !healthy) {
    DISPATCH_LOG_WARN("geo primary path degraded");
  } else if (!was && healthy) {
    DISPATCH_LOG_INFO("geo primary path recovered");
  }
}

} // namespace dispatch::geo
