#include "dispatch_engine.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/ids.hpp"
#include "order_state.hpp"

namespace dispatch::engine {

using namespace dispatch::core::v1;
using dispatch::observability::DoubleField;
using dispatch::observability::IntField;
using dispatch::observability::StringField;

namespace {

void RequireCoordinate(const geo::Coordinates& point, const char* what) {
  if (!geo::IsValidCoordinate(point)) {
    throw util::InvalidInput(std::string(what) + " is not a valid coordinate");
  }
}

bool ServesType(DriverAvailability availability, OrderType type) {
  switch (type) {
    case ORDER_TYPE_RIDE:
      return availability == DRIVER_AVAILABILITY_RIDE || availability == DRIVER_AVAILABILITY_BOTH;
    case ORDER_TYPE_DELIVERY:
      return availability == DRIVER_AVAILABILITY_DELIVERY || availability == DRIVER_AVAILABILITY_BOTH;
    default:
      return true;
  }
}

db::model::OrderEventRecord MakeEvent(const std::string& order_id, OrderEventType type, const std::string& actor_id, uint64_t at_ms,
                                      const std::optional<geo::Coordinates>& position = std::nullopt) {
  db::model::OrderEventRecord event;
  event.order_id = order_id;
  event.type     = type;
  event.actor_id = actor_id;
  event.at_ms    = at_ms;
  if (position) {
    event.has_position = true;
    event.lat          = position->latitude;
    event.lng          = position->longitude;
  }
  return event;
}

std::optional<geo::Coordinates> LastPosition(const db::model::DriverRecord& driver) {
  if (!driver.has_position) return std::nullopt;
  return geo::Coordinates{driver.last_lat, driver.last_lng};
}

geo::Coordinates Pickup(const db::model::OrderRecord& order) {
  return {order.pickup_lat, order.pickup_lng};
}

db::model::OrderRecord LoadOrder(db::Repository& repository, db::Transaction& tx, const std::string& order_id) {
  auto order = repository.GetOrder(tx, order_id);
  if (!order) {
    throw util::OrderNotFound(order_id);
  }
  return *order;
}

} // namespace

DispatchEngine::DispatchEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::GeoIndex> geo, FareTable fares,
                               EngineOptions options, MillisClock clock)
    : repository_(std::move(repository)), geo_(std::move(geo)), fares_(std::move(fares)), options_(options), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return util::NowMillis(); };
  }
}

void DispatchEngine::AddSink(std::shared_ptr<NotificationSink> sink) {
  sinks_.push_back(std::move(sink));
}

uint64_t DispatchEngine::Now() const {
  return clock_();
}

// ------------------------------------------------------------------
// Estimate / create
// ------------------------------------------------------------------

FareEstimate DispatchEngine::Estimate(const EstimateInput& input) {
  RequireCoordinate(input.pickup, "pickup");
  RequireCoordinate(input.dropoff, "dropoff");

  FareEstimate estimate;
  estimate.vehicle_class = fares_.Resolve(input.type, input.vehicle_class);

  const auto route          = geo::EstimateRoute(input.pickup, input.dropoff, options_.road_distance_factor, options_.average_speed_kmh);
  estimate.distance_km      = route.road_km;
  estimate.duration_minutes = route.duration_minutes;

  CandidateQuery query;
  query.center        = input.pickup;
  query.radius_km     = options_.search_radius_km;
  query.type          = input.type;
  query.vehicle_class = estimate.vehicle_class;
  query.limit         = options_.candidate_limit;
  const auto candidates = FindCandidates(query);

  estimate.nearby_drivers   = static_cast<uint32_t>(candidates.size());
  estimate.surge_multiplier = SurgeMultiplier(candidates.size());
  estimate.fare             = fares_.Quote(estimate.vehicle_class, estimate.distance_km, estimate.duration_minutes, estimate.surge_multiplier);
  if (!candidates.empty()) {
    estimate.pickup_minutes = candidates.front().eta_minutes;
  }
  return estimate;
}

CreatedOrder DispatchEngine::CreateOrder(const NewOrder& request) {
  observability::SpanScope span("engine.create_order");

  if (request.rider_id.empty()) {
    throw util::InvalidInput("rider id is required");
  }

  const auto estimate = Estimate({request.type, request.pickup, request.dropoff, request.vehicle_class});
  const auto now      = Now();

  db::model::OrderRecord order;
  order.id                   = util::NewId();
  order.type                 = request.type;
  order.status               = ORDER_STATUS_PENDING;
  order.rider_id             = request.rider_id;
  order.pickup_lat           = request.pickup.latitude;
  order.pickup_lng           = request.pickup.longitude;
  order.pickup_address       = request.pickup_address;
  order.dropoff_lat          = request.dropoff.latitude;
  order.dropoff_lng          = request.dropoff.longitude;
  order.dropoff_address      = request.dropoff_address;
  order.vehicle_class        = ToString(estimate.vehicle_class);
  order.distance_km          = estimate.distance_km;
  order.duration_minutes     = estimate.duration_minutes;
  order.estimated_fare       = estimate.fare.total;
  order.surge_multiplier     = estimate.surge_multiplier;
  order.otp                  = util::NewOtp();
  order.requested_at_ms      = now;
  order.search_attempts      = 1;
  order.search_expires_at_ms = now + options_.accept_timeout_ms;
  if (request.type == ORDER_TYPE_DELIVERY) {
    order.recipient_name      = request.recipient_name;
    order.recipient_phone     = request.recipient_phone;
    order.package_description = request.package_description;
  }

  db::WithRetry("create order", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->InsertOrder(*tx, order), "insert order");
    db::ThrowIfError(repository_->InsertOrderEvent(*tx, MakeEvent(order.id, ORDER_EVENT_TYPE_CREATED, order.rider_id, now, request.pickup)),
                   "insert order event");
    tx->Commit();
  });

  DISPATCH_LOG_INFO("order created", {StringField("order_id", order.id), StringField("rider_id", order.rider_id),
                                      StringField("vehicle_class", order.vehicle_class), DoubleField("fare", order.estimated_fare)});

  CreatedOrder created;
  created.order           = order;
  created.offered_drivers = Rebroadcast(order, {});
  span.SetAttribute("offered_drivers", static_cast<std::int64_t>(created.offered_drivers));
  return created;
}

// ------------------------------------------------------------------
// Accept / decline
// ------------------------------------------------------------------

db::model::OrderRecord DispatchEngine::AcceptOrder(const std::string& order_id, const std::string& driver_id) {
  observability::SpanScope span("engine.accept_order");

  struct Accepted {
    db::model::OrderRecord  order;
    db::model::DriverRecord driver;
  };

  const auto accepted = db::WithRetry("accept order", [&] {
    auto tx     = repository_->Begin();
    auto driver = repository_->GetDriver(*tx, driver_id);
    if (!driver) {
      throw util::DriverNotFound(driver_id);
    }
    if (!driver->online) {
      throw util::DriverOffline("driver " + driver_id + " is offline; go online before accepting orders");
    }

    const auto order = LoadOrder(*repository_, *tx, order_id);
    if (order.status != ORDER_STATUS_PENDING) {
      throw util::OrderNoLongerAvailable(order_id);
    }
    if (auto active = repository_->FindActiveOrderForDriver(*tx, driver_id)) {
      throw util::DriverBusy(driver_id, active->id);
    }

    const auto now    = Now();
    const auto result = repository_->AssignDriverIfPending(*tx, order_id, driver_id, now);
    if (result.code == db::ErrorCode::Conflict) {
      throw util::OrderNoLongerAvailable(order_id);
    }
    if (result.code == db::ErrorCode::NotFound) {
      throw util::OrderNotFound(order_id);
    }
    db::ThrowIfError(result, "assign driver");

    db::ThrowIfError(repository_->InsertOrderEvent(*tx, MakeEvent(order_id, ORDER_EVENT_TYPE_DRIVER_ASSIGNED, driver_id, now, LastPosition(*driver))),
                   "insert order event");

    Accepted out{LoadOrder(*repository_, *tx, order_id), *driver};
    tx->Commit();
    return out;
  });

  DISPATCH_LOG_INFO("order accepted", {StringField("order_id", order_id), StringField("driver_id", driver_id)});
  observability::Metrics::Instance().RecordDispatchEvent("accepted");

  OrderChange change;
  change.order           = accepted.order;
  change.previous_status = ORDER_STATUS_PENDING;
  change.actor_id        = driver_id;
  change.driver          = accepted.driver;
  change.eta_minutes     = PickupEta(driver_id, accepted.order);
  Notify(change);

  return accepted.order;
}

void DispatchEngine::DeclineOrder(const std::string& order_id, const std::string& driver_id, const std::string& reason) {
  const auto restarted = db::WithRetry("decline order", [&]() -> std::optional<db::model::OrderRecord> {
    auto       tx    = repository_->Begin();
    const auto order = LoadOrder(*repository_, *tx, order_id);
    if (order.status != ORDER_STATUS_PENDING) {
      return std::nullopt;
    }

    const auto now = Now();

    db::model::DeclineRecord decline;
    decline.order_id       = order_id;
    decline.driver_id      = driver_id;
    decline.reason         = reason;
    decline.declined_at_ms = now;
    db::ThrowIfError(repository_->InsertDecline(*tx, decline), "insert decline");
    db::ThrowIfError(repository_->InsertOrderEvent(*tx, MakeEvent(order_id, ORDER_EVENT_TYPE_DECLINED, driver_id, now)), "insert order event");

    const auto result = repository_->RestartSearch(*tx, order_id, now + options_.accept_timeout_ms);
    if (result.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      return std::nullopt;
    }
    db::ThrowIfError(result, "restart search");

    auto updated = LoadOrder(*repository_, *tx, order_id);
    tx->Commit();
    return updated;
  });

  if (!restarted) {
    DISPATCH_LOG_DEBUG("decline ignored, order no longer pending", {StringField("order_id", order_id), StringField("driver_id", driver_id)});
    return;
  }

  DISPATCH_LOG_INFO("order declined", {StringField("order_id", order_id), StringField("driver_id", driver_id)});
  observability::Metrics::Instance().RecordDispatchEvent("declined");
  Rebroadcast(*restarted, DeclinedDrivers(order_id));
}

// ------------------------------------------------------------------
// Progress / cancel
// ------------------------------------------------------------------

db::model::OrderRecord DispatchEngine::UpdateStatus(const StatusChange& change) {
  if (change.status == ORDER_STATUS_DRIVER_ASSIGNED) {
    return AcceptOrder(change.order_id, change.actor_id);
  }
  if (change.status == ORDER_STATUS_CANCELLED) {
    return CancelOrder(change.order_id, change.actor_id, "");
  }
  if (change.position) {
    RequireCoordinate(*change.position, "position");
  }

  observability::SpanScope span("engine.update_status");

  const auto committed = db::WithRetry("update order status", [&] {
    auto       tx    = repository_->Begin();
    const auto order = LoadOrder(*repository_, *tx, change.order_id);

    if (order.driver_id.empty() || order.driver_id != change.actor_id) {
      throw util::Forbidden("only the assigned driver may update order " + change.order_id);
    }
    if (!CanTransition(order.status, change.status)) {
      throw util::InvalidStatusTransition(StatusName(order.status), StatusName(change.status));
    }

    const auto now     = Now();
    auto       updated = order;
    updated.status     = change.status;

    if (change.status == ORDER_STATUS_IN_PROGRESS) {
      if (change.otp != order.otp) {
        throw util::InvalidOtp();
      }
      updated.started_at_ms = now;
    }

    auto driver = repository_->GetDriver(*tx, order.driver_id);
    if (change.status == ORDER_STATUS_COMPLETED) {
      updated.completed_at_ms = now;
      updated.final_fare      = order.estimated_fare;
      if (driver) {
        if (order.type == ORDER_TYPE_DELIVERY) {
          driver->total_deliveries++;
        } else {
          driver->total_rides++;
        }
        db::ThrowIfError(repository_->UpdateDriver(*tx, *driver), "update driver counters");
      }
    }

    const auto result = repository_->UpdateOrderIfStatus(*tx, updated, order.status);
    if (result.code == db::ErrorCode::Conflict) {
      throw db::TransactionConflict("order " + change.order_id + " changed concurrently");
    }
    db::ThrowIfError(result, "update order");

    db::ThrowIfError(repository_->InsertOrderEvent(*tx, MakeEvent(change.order_id, EventFor(change.status), change.actor_id, now, change.position)),
                   "insert order event");
    tx->Commit();

    OrderChange out;
    out.order           = updated;
    out.previous_status = order.status;
    out.actor_id        = change.actor_id;
    out.driver          = driver;
    return out;
  });

  DISPATCH_LOG_INFO("order status changed", {StringField("order_id", change.order_id), StringField("from", StatusName(committed.previous_status)),
                                             StringField("to", StatusName(change.status))});
  Notify(committed);
  return committed.order;
}

db::model::OrderRecord DispatchEngine::CancelOrder(const std::string& order_id, const std::string& actor_id, const std::string& reason) {
  observability::SpanScope span("engine.cancel_order");

  const auto committed = db::WithRetry("cancel order", [&] {
    auto       tx    = repository_->Begin();
    const auto order = LoadOrder(*repository_, *tx, order_id);

    if (actor_id.empty() || (actor_id != order.rider_id && actor_id != order.driver_id)) {
      throw util::Forbidden("only the rider or the assigned driver may cancel order " + order_id);
    }
    if (order.status == ORDER_STATUS_COMPLETED) {
      throw util::OrderAlreadyCompleted(order_id);
    }
    if (!CanTransition(order.status, ORDER_STATUS_CANCELLED)) {
      throw util::InvalidStatusTransition(StatusName(order.status), StatusName(ORDER_STATUS_CANCELLED));
    }

    const auto now              = Now();
    auto       updated          = order;
    updated.status              = ORDER_STATUS_CANCELLED;
    updated.driver_id.clear();
    updated.cancelled_at_ms     = now;
    updated.cancelled_by        = actor_id;
    updated.cancellation_reason = reason;
    updated.search_expires_at_ms = 0;

    const auto result = repository_->UpdateOrderIfStatus(*tx, updated, order.status);
    if (result.code == db::ErrorCode::Conflict) {
      throw db::TransactionConflict("order " + order_id + " changed concurrently");
    }
    db::ThrowIfError(result, "cancel order");
    db::ThrowIfError(repository_->InsertOrderEvent(*tx, MakeEvent(order_id, ORDER_EVENT_TYPE_CANCELLED, actor_id, now)), "insert order event");

    OrderChange out;
    out.order           = updated;
    out.previous_status = order.status;
    out.actor_id        = actor_id;
    if (!order.driver_id.empty()) {
      out.driver = repository_->GetDriver(*tx, order.driver_id);
    }
    tx->Commit();
    return out;
  });

  DISPATCH_LOG_INFO("order cancelled", {StringField("order_id", order_id), StringField("cancelled_by", actor_id),
                                        StringField("from", StatusName(committed.previous_status))});
  observability::Metrics::Instance().RecordDispatchEvent("cancelled");
  Notify(committed);
  return committed.order;
}

void DispatchEngine::RateOrder(const std::string& order_id, const std::string& from_id, int32_t stars, const std::string& comment) {
  if (stars < 1 || stars > 5) {
    throw util::InvalidInput("stars must be between 1 and 5");
  }

  db::WithRetry("rate order", [&] {
    auto       tx    = repository_->Begin();
    const auto order = LoadOrder(*repository_, *tx, order_id);
    if (order.status != ORDER_STATUS_COMPLETED) {
      throw util::InvalidInput("only completed orders can be rated");
    }

    db::model::RatingRecord rating;
    rating.order_id      = order_id;
    rating.from_id       = from_id;
    rating.stars         = stars;
    rating.comment       = comment;
    rating.created_at_ms = Now();
    if (from_id == order.rider_id) {
      rating.to_id = order.driver_id;
    } else if (from_id == order.driver_id) {
      rating.to_id = order.rider_id;
    } else {
      throw util::Forbidden("only a party of order " + order_id + " may rate it");
    }

    const auto result = repository_->InsertRating(*tx, rating);
    if (result.code == db::ErrorCode::AlreadyExists) {
      throw util::AlreadyRated(order_id);
    }
    db::ThrowIfError(result, "insert rating");

    // Rider ratings feed the driver's average.
    if (rating.to_id == order.driver_id) {
      auto driver = repository_->GetDriver(*tx, order.driver_id);
      if (driver) {
        const auto ratings = repository_->ListRatingsFor(*tx, driver->id);
        double     sum     = 0;
        for (const auto& r : ratings) {
          sum += r.stars;
        }
        driver->rating = ratings.empty() ? 5.0 : geo::RoundTo(sum / static_cast<double>(ratings.size()), 2);
        db::ThrowIfError(repository_->UpdateDriver(*tx, *driver), "update driver rating");
      }
    }
    tx->Commit();
  });
}

// ------------------------------------------------------------------
// Search timeout loop
// ------------------------------------------------------------------

size_t DispatchEngine::SweepExpiredSearches(uint64_t now_ms) {
  std::vector<db::model::OrderRecord> expired;
  {
    auto tx = repository_->Begin();
    expired = repository_->ListExpiredSearches(*tx, now_ms, options_.sweep_batch);
  }

  size_t claimed_count = 0;
  for (const auto& order : expired) {
    const bool     exhausted = options_.max_search_attempts != 0 && order.search_attempts >= options_.max_search_attempts;
    const uint64_t next      = exhausted ? 0 : now_ms + options_.accept_timeout_ms;

    try {
      const auto claimed = db::WithRetry("claim search expiry", [&]() -> std::optional<db::model::OrderRecord> {
        auto       tx     = repository_->Begin();
        const auto result = repository_->ClaimSearchExpiry(*tx, order.id, order.search_expires_at_ms, next);
        if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
          return std::nullopt;
        }
        db::ThrowIfError(result, "claim search expiry");
        db::ThrowIfError(repository_->InsertOrderEvent(*tx, MakeEvent(order.id, ORDER_EVENT_TYPE_SEARCH_TIMEOUT, "", now_ms)), "insert order event");

        auto updated = LoadOrder(*repository_, *tx, order.id);
        tx->Commit();
        return updated;
      });
      if (!claimed) {
        continue;
      }

      ++claimed_count;
      observability::Metrics::Instance().RecordDispatchEvent("search_timeout");

      if (exhausted) {
        DISPATCH_LOG_WARN("search exhausted, order stays pending",
                          {StringField("order_id", order.id), IntField("attempts", static_cast<std::int64_t>(order.search_attempts))});
        continue;
      }

      DISPATCH_LOG_INFO("accept window expired, rebroadcasting",
                        {StringField("order_id", order.id), IntField("attempt", static_cast<std::int64_t>(claimed->search_attempts))});
      // A timeout records no decline; only explicit declines are excluded.
      Rebroadcast(*claimed, DeclinedDrivers(order.id));
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("search expiry handling failed", {StringField("order_id", order.id), StringField("error", e.what())});
    }
  }
  return claimed_count;
}

// ------------------------------------------------------------------
// Candidates / offers
// ------------------------------------------------------------------

std::vector<Candidate> DispatchEngine::FindCandidates(const CandidateQuery& query) {
  const auto hits = geo_->Query(query.center, query.radius_km, 0);

  std::vector<Candidate> out;
  if (hits.empty()) {
    return out;
  }

  auto tx = repository_->Begin();
  for (const auto& hit : hits) {
    if (query.limit != 0 && out.size() >= query.limit) {
      break;
    }
    if (query.exclude.count(hit.driver_id)) {
      continue;
    }

    auto driver = repository_->GetDriver(*tx, hit.driver_id);
    if (!driver || !driver->online || !ServesType(driver->availability, query.type)) {
      continue;
    }
    if (query.vehicle_class && query.type != ORDER_TYPE_DELIVERY) {
      const auto driver_class = ParseVehicleClass(driver->vehicle_class);
      if (!driver_class || *driver_class != *query.vehicle_class) {
        continue;
      }
    }

    Candidate candidate;
    candidate.driver_id   = hit.driver_id;
    candidate.distance_km = hit.distance_km;
    candidate.eta_minutes = geo::EtaMinutes(hit.position, query.center, options_.road_distance_factor, options_.average_speed_kmh);
    candidate.position    = hit.position;
    candidate.driver      = std::move(*driver);
    out.push_back(std::move(candidate));
  }
  return out;
}

uint32_t DispatchEngine::Rebroadcast(const db::model::OrderRecord& order, const std::unordered_set<std::string>& exclude) {
  CandidateQuery query;
  query.center        = Pickup(order);
  query.radius_km     = options_.search_radius_km;
  query.type          = order.type;
  query.vehicle_class = ParseVehicleClass(order.vehicle_class);
  query.exclude       = exclude;
  query.limit         = options_.candidate_limit;

  const auto candidates = FindCandidates(query);
  if (candidates.empty()) {
    DISPATCH_LOG_WARN("no drivers available", {StringField("order_id", order.id), IntField("excluded", static_cast<std::int64_t>(exclude.size())),
                                               DoubleField("radius_km", options_.search_radius_km)});
    observability::Metrics::Instance().RecordDispatchEvent("no_drivers");
    return 0;
  }

  Offer(order, candidates, order.search_attempts);
  return static_cast<uint32_t>(candidates.size());
}

std::unordered_set<std::string> DispatchEngine::DeclinedDrivers(const std::string& order_id) {
  auto                            tx = repository_->Begin();
  std::unordered_set<std::string> out;
  for (const auto& decline : repository_->ListDeclines(*tx, order_id)) {
    out.insert(decline.driver_id);
  }
  return out;
}

int32_t DispatchEngine::PickupEta(const std::string& driver_id, const db::model::OrderRecord& order) {
  const auto distance = geo_->DistanceTo(driver_id, Pickup(order));
  if (!distance) {
    return kDefaultPickupMinutes;
  }
  return geo::TravelMinutes(*distance, options_.road_distance_factor, options_.average_speed_kmh);
}

void DispatchEngine::Offer(const db::model::OrderRecord& order, const std::vector<Candidate>& candidates, uint32_t attempt) {
  for (const auto& candidate : candidates) {
    for (const auto& sink : sinks_) {
      try {
        sink->OnOffer(order, candidate, attempt);
      } catch (const std::exception& e) {
        DISPATCH_LOG_WARN("notification sink failed", {StringField("sink", sink->Name()), StringField("order_id", order.id),
                                                       StringField("driver_id", candidate.driver_id), StringField("error", e.what())});
      }
    }
  }
  observability::Metrics::Instance().RecordDispatchEvent("offer");
  DISPATCH_LOG_INFO("offers sent", {StringField("order_id", order.id), IntField("drivers", static_cast<std::int64_t>(candidates.size())),
                                    IntField("attempt", attempt)});
}

void DispatchEngine::Notify(const OrderChange& change) {
  for (const auto& sink : sinks_) {
    try {
      sink->OnStatusChanged(change);
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("notification sink failed",
                        {StringField("sink", sink->Name()), StringField("order_id", change.order.id), StringField("error", e.what())});
    }
  }
}

} // namespace dispatch::engine
