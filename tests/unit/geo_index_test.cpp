#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/async/task_worker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/geo/memory_geo_backend.hpp"

namespace {

using namespace dispatch;

const geo::Coordinates kCenter{19.0760, 72.8777};

// Primary that can be switched into failing or stalling.
class FlakyBackend final : public geo::GeoBackend {
 public:
  enum class Mode { kHealthy, kThrow, kStall };

  void Set(Mode mode) {
    mode_ = mode;
  }

  void Upsert(const std::string& driver_id, const geo::Coordinates& position, double heading, std::chrono::milliseconds ttl) override {
    Check();
    inner_.Upsert(driver_id, position, heading, ttl);
  }

  void Remove(const std::string& driver_id) override {
    Check();
    inner_.Remove(driver_id);
  }

  std::vector<geo::GeoHit> Radius(const geo::Coordinates& center, double radius_km, uint32_t limit) override {
    Check();
    return inner_.Radius(center, radius_km, limit);
  }

  std::optional<geo::Coordinates> Position(const std::string& driver_id) override {
    Check();
    return inner_.Position(driver_id);
  }

  size_t Size() override {
    Check();
    return inner_.Size();
  }

 private:
  void Check() {
    if (mode_ == Mode::kThrow) throw std::runtime_error("backend unavailable");
    if (mode_ == Mode::kStall) std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  std::atomic<Mode>     mode_{Mode::kHealthy};
  geo::MemoryGeoBackend inner_;
};

struct Fixture {
  Fixture() {
    worker->Start();
    geo::GeoIndexOptions options;
    options.entry_ttl_ms      = 60'000;
    options.query_timeout_ms  = 50;
    options.upsert_timeout_ms = 50;
    index                     = std::make_shared<geo::GeoIndex>(backend, repo, worker, options);
  }

  ~Fixture() {
    worker->Stop();
  }

  void StoreDriver(const std::string& id, const geo::Coordinates& position, bool online = true) {
    db::model::DriverRecord driver;
    driver.id           = id;
    driver.online       = online;
    driver.has_position = true;
    driver.last_lat     = position.latitude;
    driver.last_lng     = position.longitude;

    auto       tx       = repo->Begin();
    const auto inserted = repo->InsertDriver(*tx, driver);
    assert(inserted);
    tx->Commit();
  }

  std::shared_ptr<db::memory::MemoryRepository> repo    = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<FlakyBackend>                 backend = std::make_shared<FlakyBackend>();
  std::shared_ptr<async::TaskWorker>            worker  = std::make_shared<async::TaskWorker>("geo-test", 4);
  std::shared_ptr<geo::GeoIndex>                index;
};

void TestPrimaryQueryIsSortedAndFiltered() {
  Fixture f;
  f.index->Upsert("far", {19.0760 + 0.05, 72.8777}, 0);  // ~5.6 km
  f.index->Upsert("near", {19.0760 + 0.01, 72.8777}, 0); // ~1.1 km
  f.index->Upsert("mid", {19.0760, 72.8777 + 0.03}, 0);  // ~3.2 km
  f.index->Upsert("out", {19.0760 + 0.2, 72.8777}, 0);   // ~22 km

  const auto hits = f.index->Query(kCenter, 10.0, 0);
  assert(hits.size() == 3);
  assert(hits[0].driver_id == "near");
  assert(hits[1].driver_id == "mid");
  assert(hits[2].driver_id == "far");
  for (const auto& hit : hits) {
    assert(hit.distance_km <= 10.0);
  }

  const auto limited = f.index->Query(kCenter, 10.0, 2);
  assert(limited.size() == 2);
  assert(limited[0].driver_id == "near");

  assert(f.index->IndexedCount() == 4);
  assert(f.index->PrimaryHealthy());
}

void TestInvalidQueryReturnsNothing() {
  Fixture f;
  f.index->Upsert("d1", kCenter, 0);
  assert(f.index->Query({120.0, 0}, 5.0, 0).empty());
  assert(f.index->Query(kCenter, 0.0, 0).empty());
}

void TestUpsertMovesAndRemoveDeletes() {
  Fixture f;
  f.index->Upsert("d1", {19.0760 + 0.3, 72.8777}, 0);
  assert(f.index->Query(kCenter, 5.0, 0).empty());

  f.index->Upsert("d1", {19.0760 + 0.001, 72.8777}, 90);
  auto hits = f.index->Query(kCenter, 5.0, 0);
  assert(hits.size() == 1);
  assert(f.index->IndexedCount() == 1);

  const auto distance = f.index->DistanceTo("d1", kCenter);
  assert(distance.has_value());
  assert(*distance < 0.2);

  f.index->Remove("d1");
  assert(f.index->Query(kCenter, 5.0, 0).empty());
  assert(f.index->IndexedCount() == 0);
}

void TestExpiredEntriesDisappear() {
  geo::MemoryGeoBackend backend;
  backend.Upsert("short", kCenter, 0, std::chrono::milliseconds(20));
  backend.Upsert("long", {19.0770, 72.8777}, 0, std::chrono::milliseconds(60'000));
  assert(backend.Size() == 2);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const auto hits = backend.Radius(kCenter, 5.0, 0);
  assert(hits.size() == 1);
  assert(hits[0].driver_id == "long");
  assert(!backend.Position("short").has_value());
  assert(backend.Size() == 1);
}

void TestFailingPrimaryFallsBackToStore() {
  Fixture f;
  f.StoreDriver("stored-near", {19.0760 + 0.01, 72.8777});
  f.StoreDriver("stored-far", {19.0760 + 0.04, 72.8777});
  f.StoreDriver("stored-offline", {19.0760 + 0.005, 72.8777}, false);
  f.StoreDriver("stored-corner", {19.0760 + 0.08, 72.8777 + 0.08}); // inside the box, outside the circle

  f.backend->Set(FlakyBackend::Mode::kThrow);
  const auto hits = f.index->Query(kCenter, 10.0, 0);
  assert(!f.index->PrimaryHealthy());
  assert(hits.size() == 2);
  assert(hits[0].driver_id == "stored-near");
  assert(hits[1].driver_id == "stored-far");

  // stored positions also answer distance lookups
  const auto distance = f.index->DistanceTo("stored-far", kCenter);
  assert(distance.has_value());
  assert(*distance > 4.0 && *distance < 5.0);

  // upserts never throw to the caller
  f.index->Upsert("d9", kCenter, 0);

  f.backend->Set(FlakyBackend::Mode::kHealthy);
  f.index->Upsert("d9", kCenter, 0);
  assert(f.index->PrimaryHealthy());
  const auto recovered = f.index->Query(kCenter, 10.0, 0);
  assert(recovered.size() == 1);
  assert(recovered[0].driver_id == "d9");
}

void TestEmptyPrimaryFallsBackToStore() {
  Fixture f;
  // stored and online, but the index entry has lapsed
  f.StoreDriver("parked", {19.0760 + 0.01, 72.8777});
  f.StoreDriver("parked-offline", {19.0760 + 0.005, 72.8777}, false);

  const auto hits = f.index->Query(kCenter, 5.0, 0);
  assert(hits.size() == 1);
  assert(hits[0].driver_id == "parked");
  assert(hits[0].distance_km > 1.0 && hits[0].distance_km < 1.2);
  assert(f.index->PrimaryHealthy());

  // a non-empty primary answer is used as is
  f.index->Upsert("live", kCenter, 0);
  const auto live = f.index->Query(kCenter, 5.0, 0);
  assert(live.size() == 1);
  assert(live[0].driver_id == "live");
}

void TestFallbackAcrossAntimeridian() {
  Fixture f;
  const geo::Coordinates fiji{-17.70, 179.99};
  f.StoreDriver("east", {-17.70, -179.99}); // ~2.1 km across 180
  f.StoreDriver("west", {-17.70, 179.97});  // ~2.1 km
  f.StoreDriver("far", {-17.70, -179.50});

  f.backend->Set(FlakyBackend::Mode::kThrow);
  const auto hits = f.index->Query(fiji, 5.0, 0);
  assert(hits.size() == 2);
  assert((hits[0].driver_id == "east" && hits[1].driver_id == "west") || (hits[0].driver_id == "west" && hits[1].driver_id == "east"));
  for (const auto& hit : hits) {
    assert(hit.distance_km < 2.5);
  }
  f.backend->Set(FlakyBackend::Mode::kHealthy);
}

void TestStalledPrimaryTimesOut() {
  Fixture f;
  f.StoreDriver("stored", {19.0760 + 0.01, 72.8777});

  f.backend->Set(FlakyBackend::Mode::kStall);
  const auto started = std::chrono::steady_clock::now();
  const auto hits    = f.index->Query(kCenter, 10.0, 0);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(elapsed < std::chrono::milliseconds(250));
  assert(hits.size() == 1);
  assert(hits[0].driver_id == "stored");
  assert(!f.index->PrimaryHealthy());

  f.backend->Set(FlakyBackend::Mode::kHealthy);
}

} // namespace

int main() {
  TestPrimaryQueryIsSortedAndFiltered();
  TestInvalidQueryReturnsNothing();
  TestUpsertMovesAndRemoveDeletes();
  TestExpiredEntriesDisappear();
  TestFailingPrimaryFallsBackToStore();
  TestEmptyPrimaryFallsBackToStore();
  TestFallbackAcrossAntimeridian();
  TestStalledPrimaryTimesOut();
  std::cout << "geo_index_test: pass\n";
  return 0;
}
