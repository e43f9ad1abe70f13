#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace dispatch::db::memory {

using dispatch::core::v1::ORDER_EVENT_TYPE_DRIVER_ASSIGNED;
using dispatch::core::v1::ORDER_STATUS_CANCELLED;
using dispatch::core::v1::ORDER_STATUS_COMPLETED;
using dispatch::core::v1::ORDER_STATUS_DRIVER_ASSIGNED;
using dispatch::core::v1::ORDER_STATUS_PENDING;
using dispatch::core::v1::OrderStatus;

namespace {

bool IsOpen(const model::OrderRecord& o) {
  return o.status != ORDER_STATUS_COMPLETED && o.status != ORDER_STATUS_CANCELLED;
}

// newest first, id as tie breaker so paging is stable
bool NewerFirst(const model::OrderRecord& a, const model::OrderRecord& b) {
  if (a.requested_at_ms != b.requested_at_ms) return a.requested_at_ms > b.requested_at_ms;
  return a.id > b.id;
}

template <typename Pred>
std::optional<model::OrderRecord> NewestMatching(const std::unordered_map<std::string, model::OrderRecord>& orders, Pred pred) {
  const model::OrderRecord* best = nullptr;
  for (const auto& [_, o] : orders) {
    if (!pred(o)) continue;
    if (!best || NewerFirst(o, *best)) best = &o;
  }
  if (!best) return std::nullopt;
  return *best;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result MemoryRepository::InsertOrder(Transaction& t, const model::OrderRecord& r) {
  if (TX(t).Read().orders.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Write().orders[r.id] = r;
  return Result::Ok();
}

std::optional<model::OrderRecord> MemoryRepository::GetOrder(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).Read();
  auto        it = s.orders.find(id);
  if (it == s.orders.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateOrderIfStatus(Transaction& t, const model::OrderRecord& r, OrderStatus expected) {
  const auto& s  = TX(t).Read();
  auto        it = s.orders.find(r.id);
  if (it == s.orders.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "order status changed");
  TX(t).Write().orders[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::AssignDriverIfPending(Transaction& t, const std::string& order_id, const std::string& driver_id,
                                               uint64_t accepted_at_ms) {
  const auto& s  = TX(t).Read();
  auto        it = s.orders.find(order_id);
  if (it == s.orders.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != ORDER_STATUS_PENDING) return Result::Err(ErrorCode::Conflict, "order is not pending");

  auto& o                = TX(t).Write().orders[order_id];
  o.status               = ORDER_STATUS_DRIVER_ASSIGNED;
  o.driver_id            = driver_id;
  o.accepted_at_ms       = accepted_at_ms;
  o.search_expires_at_ms = 0;
  return Result::Ok();
}

Result MemoryRepository::RestartSearch(Transaction& t, const std::string& order_id, uint64_t next_expires_at_ms) {
  const auto& s  = TX(t).Read();
  auto        it = s.orders.find(order_id);
  if (it == s.orders.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != ORDER_STATUS_PENDING) return Result::Err(ErrorCode::Conflict, "order is not pending");

  auto& o                = TX(t).Write().orders[order_id];
  o.search_expires_at_ms = next_expires_at_ms;
  o.search_attempts++;
  return Result::Ok();
}

Result MemoryRepository::ClaimSearchExpiry(Transaction& t, const std::string& order_id, uint64_t expected_expires_at_ms,
                                           uint64_t next_expires_at_ms) {
  const auto& s  = TX(t).Read();
  auto        it = s.orders.find(order_id);
  if (it == s.orders.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != ORDER_STATUS_PENDING || it->second.search_expires_at_ms != expected_expires_at_ms) {
    return Result::Err(ErrorCode::Conflict, "search expiry already claimed");
  }

  auto& o                = TX(t).Write().orders[order_id];
  o.search_expires_at_ms = next_expires_at_ms;
  if (next_expires_at_ms != 0) o.search_attempts++;
  return Result::Ok();
}

std::vector<model::OrderRecord> MemoryRepository::ListExpiredSearches(Transaction& t, uint64_t now_ms, uint32_t limit) {
  std::vector<model::OrderRecord> out;
  for (const auto& [_, o] : TX(t).Read().orders) {
    if (o.status == ORDER_STATUS_PENDING && o.search_expires_at_ms != 0 && o.search_expires_at_ms <= now_ms) out.push_back(o);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.search_expires_at_ms != b.search_expires_at_ms) return a.search_expires_at_ms < b.search_expires_at_ms;
    return a.id < b.id;
  });
  if (limit && out.size() > limit) out.resize(limit);
  return out;
}

std::optional<model::OrderRecord> MemoryRepository::FindActiveOrderForRider(Transaction& t, const std::string& rider_id) {
  return NewestMatching(TX(t).Read().orders, [&](const model::OrderRecord& o) { return o.rider_id == rider_id && IsOpen(o); });
}

std::optional<model::OrderRecord> MemoryRepository::FindActiveOrderForDriver(Transaction& t, const std::string& driver_id) {
  return NewestMatching(TX(t).Read().orders, [&](const model::OrderRecord& o) { return o.driver_id == driver_id && IsOpen(o); });
}

std::vector<model::OrderRecord> MemoryRepository::ListOrdersForParticipant(Transaction& t, const std::string& participant_id, uint32_t offset,
                                                                           uint32_t limit) {
  std::vector<model::OrderRecord> all;
  for (const auto& [_, o] : TX(t).Read().orders) {
    if (o.rider_id == participant_id || o.driver_id == participant_id) all.push_back(o);
  }
  std::sort(all.begin(), all.end(), NewerFirst);

  if (offset >= all.size()) return {};
  auto end = limit ? std::min<size_t>(all.size(), static_cast<size_t>(offset) + limit) : all.size();
  return {all.begin() + offset, all.begin() + end};
}

uint64_t MemoryRepository::CountOrdersForParticipant(Transaction& t, const std::string& participant_id) {
  uint64_t n = 0;
  for (const auto& [_, o] : TX(t).Read().orders) {
    if (o.rider_id == participant_id || o.driver_id == participant_id) ++n;
  }
  return n;
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result MemoryRepository::InsertDriver(Transaction& t, const model::DriverRecord& r) {
  if (TX(t).Read().drivers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Write().drivers[r.id] = r;
  return Result::Ok();
}

std::optional<model::DriverRecord> MemoryRepository::GetDriver(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).Read();
  auto        it = s.drivers.find(id);
  if (it == s.drivers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateDriver(Transaction& t, const model::DriverRecord& r) {
  if (!TX(t).Read().drivers.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Write().drivers[r.id] = r;
  return Result::Ok();
}

std::vector<model::DriverRecord> MemoryRepository::ListOnlineDriversInBox(Transaction& t, double min_lat, double max_lat, double min_lng,
                                                                          double max_lng) {
  std::vector<model::DriverRecord> out;
  for (const auto& [_, d] : TX(t).Read().drivers) {
    if (!d.online || !d.has_position) continue;
    if (d.last_lat < min_lat || d.last_lat > max_lat) continue;
    if (d.last_lng < min_lng || d.last_lng > max_lng) continue;
    out.push_back(d);
  }
  return out;
}

model::DriverOrderStats MemoryRepository::GetDriverOrderStats(Transaction& t, const std::string& driver_id) {
  const auto&             s = TX(t).Read();
  model::DriverOrderStats stats;
  for (const auto& e : s.events) {
    if (e.type == ORDER_EVENT_TYPE_DRIVER_ASSIGNED && e.actor_id == driver_id) stats.assigned++;
  }
  for (const auto& [_, o] : s.orders) {
    if (o.driver_id == driver_id && o.status == ORDER_STATUS_COMPLETED) {
      stats.completed++;
      stats.earnings += o.final_fare;
    }
  }
  return stats;
}

// ------------------------------------------------------------------
// Declines / events / ratings
// ------------------------------------------------------------------

Result MemoryRepository::InsertDecline(Transaction& t, const model::DeclineRecord& r) {
  TX(t).Write().declines.push_back(r);
  return Result::Ok();
}

std::vector<model::DeclineRecord> MemoryRepository::ListDeclines(Transaction& t, const std::string& order_id) {
  std::vector<model::DeclineRecord> out;
  for (const auto& d : TX(t).Read().declines)
    if (d.order_id == order_id) out.push_back(d);
  return out;
}

Result MemoryRepository::InsertOrderEvent(Transaction& t, const model::OrderEventRecord& r) {
  TX(t).Write().events.push_back(r);
  return Result::Ok();
}

std::vector<model::OrderEventRecord> MemoryRepository::ListOrderEvents(Transaction& t, const std::string& order_id) {
  std::vector<model::OrderEventRecord> out;
  for (const auto& e : TX(t).Read().events)
    if (e.order_id == order_id) out.push_back(e);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.at_ms < b.at_ms; });
  return out;
}

Result MemoryRepository::InsertRating(Transaction& t, const model::RatingRecord& r) {
  for (const auto& existing : TX(t).Read().ratings) {
    if (existing.order_id == r.order_id && existing.from_id == r.from_id) return Result::Err(ErrorCode::AlreadyExists);
  }
  TX(t).Write().ratings.push_back(r);
  return Result::Ok();
}

std::vector<model::RatingRecord> MemoryRepository::ListRatingsFor(Transaction& t, const std::string& to_id) {
  std::vector<model::RatingRecord> out;
  for (const auto& r : TX(t).Read().ratings)
    if (r.to_id == to_id) out.push_back(r);
  return out;
}

} // namespace dispatch::db::memory
