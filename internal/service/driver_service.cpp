#include "driver_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/engine/dispatch_engine.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/tracking/location_tracker.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace dispatch::service {

using namespace dispatch::core::v1;
using namespace dispatch::services::v1;

namespace {

constexpr uint32_t kDefaultNearbyLimit = 20;
constexpr uint32_t kMaxNearbyLimit     = 100;
constexpr double   kMaxNearbyRadiusKm  = 50.0;

// Empty picks the default for the availability; BOTH drivers default to CAR.
std::string ResolveVehicleClass(const std::string& code, DriverAvailability availability) {
  if (code.empty()) {
    return availability == DRIVER_AVAILABILITY_DELIVERY ? engine::ToString(engine::VehicleClass::kSmall)
                                                        : engine::ToString(engine::VehicleClass::kCar);
  }

  const auto vehicle_class = engine::ParseVehicleClass(code);
  if (!vehicle_class) {
    throw util::UnknownVehicleClass(code);
  }
  if (availability == DRIVER_AVAILABILITY_RIDE && !engine::BelongsTo(*vehicle_class, ORDER_TYPE_RIDE)) {
    throw util::UnknownVehicleClass(code);
  }
  if (availability == DRIVER_AVAILABILITY_DELIVERY && !engine::BelongsTo(*vehicle_class, ORDER_TYPE_DELIVERY)) {
    throw util::UnknownVehicleClass(code);
  }
  return engine::ToString(*vehicle_class);
}

db::model::DriverRecord LoadDriver(db::Repository& repository, db::Transaction& tx, const std::string& driver_id) {
  auto driver = repository.GetDriver(tx, driver_id);
  if (!driver) {
    throw util::DriverNotFound(driver_id);
  }
  return *driver;
}

} // namespace

DriverService::DriverService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterDriverResponse DriverService::RegisterDriver(const auth::Identity& caller, const RegisterDriverRequest& req) {
  return ObserveRpc("DriverService.RegisterDriver", &caller, [&] {
    RequireRole(caller, auth::Role::kDriver, "register as a driver");

    db::model::DriverRecord driver;
    driver.id            = caller.id;
    driver.online        = false;
    driver.availability  = req.availability() == DRIVER_AVAILABILITY_UNSPECIFIED ? DRIVER_AVAILABILITY_RIDE : req.availability();
    driver.vehicle_class = ResolveVehicleClass(req.vehicle().vehicle_class(), driver.availability);
    driver.plate         = req.vehicle().plate();
    driver.model         = req.vehicle().model();
    driver.color         = req.vehicle().color();
    driver.rating        = 5.0;

    db::WithRetry("register driver", [&] {
      auto       tx     = ctx_.repository->Begin();
      const auto result = ctx_.repository->InsertDriver(*tx, driver);
      if (result.code == db::ErrorCode::AlreadyExists) {
        throw util::DriverAlreadyExists(caller.id);
      }
      db::ThrowIfError(result, "insert driver");
      tx->Commit();
    });

    RegisterDriverResponse resp;
    *resp.mutable_driver() = ToProto(driver);
    return resp;
  });
}

GetDriverResponse DriverService::GetDriver(const auth::Identity& caller, const GetDriverRequest& req) {
  return ObserveRpc("DriverService.GetDriver", &caller, [&] {
    const auto& driver_id = req.driver_id().empty() ? caller.id : req.driver_id();

    auto tx = ctx_.repository->Begin();

    GetDriverResponse resp;
    *resp.mutable_driver() = ToProto(LoadDriver(*ctx_.repository, *tx, driver_id));
    return resp;
  });
}

SetAvailabilityResponse DriverService::SetAvailability(const auth::Identity& caller, const SetAvailabilityRequest& req) {
  return ObserveRpc("DriverService.SetAvailability", &caller, [&] {
    RequireRole(caller, auth::Role::kDriver, "change availability");

    const auto driver = db::WithRetry("set availability", [&] {
      auto tx       = ctx_.repository->Begin();
      auto record   = LoadDriver(*ctx_.repository, *tx, caller.id);
      record.online = req.online();
      if (req.availability() != DRIVER_AVAILABILITY_UNSPECIFIED) {
        record.availability = req.availability();
      }
      db::ThrowIfError(ctx_.repository->UpdateDriver(*tx, record), "update driver");
      tx->Commit();
      return record;
    });

    if (!driver.online) {
      ctx_.geo->Remove(driver.id);
    } else if (driver.has_position) {
      ctx_.geo->Upsert(driver.id, {driver.last_lat, driver.last_lng}, driver.heading);
    }

    SetAvailabilityResponse resp;
    *resp.mutable_driver() = ToProto(driver);
    return resp;
  });
}

ReportLocationResponse DriverService::ReportLocation(const auth::Identity& caller, const ReportLocationRequest& req) {
  return ObserveRpc("DriverService.ReportLocation", &caller, [&] {
    RequireRole(caller, auth::Role::kDriver, "report a location");

    const auto update = ctx_.tracker->ReportLocation(caller.id, {req.latitude(), req.longitude()}, req.heading());

    ReportLocationResponse resp;
    resp.set_updated(update.updated);
    if (update.distance_meters) {
      resp.set_distance_meters(*update.distance_meters);
    }
    return resp;
  });
}

FindNearbyDriversResponse DriverService::FindNearbyDrivers(const auth::Identity& caller, const FindNearbyDriversRequest& req) {
  return ObserveRpc("DriverService.FindNearbyDrivers", &caller, [&] {
    if (!req.has_center()) {
      throw util::InvalidInput("center is required");
    }

    engine::CandidateQuery query;
    query.center = FromProto(req.center());
    if (!geo::IsValidCoordinate(query.center)) {
      throw util::InvalidInput("center is not a valid coordinate");
    }
    query.radius_km = req.radius_km() > 0 ? std::min(req.radius_km(), kMaxNearbyRadiusKm) : ctx_.engine->Options().search_radius_km;
    query.type      = req.type();
    query.limit     = req.limit() == 0 ? kDefaultNearbyLimit : std::min(req.limit(), kMaxNearbyLimit);
    if (!req.vehicle_class().empty()) {
      if (req.type() == ORDER_TYPE_UNSPECIFIED) {
        query.vehicle_class = engine::ParseVehicleClass(req.vehicle_class());
        if (!query.vehicle_class) {
          throw util::UnknownVehicleClass(req.vehicle_class());
        }
      } else {
        query.vehicle_class = ctx_.engine->Fares().Resolve(req.type(), req.vehicle_class());
      }
    }

    FindNearbyDriversResponse resp;
    for (const auto& candidate : ctx_.engine->FindCandidates(query)) {
      auto* out = resp.add_drivers();
      out->set_driver_id(candidate.driver_id);
      out->set_distance_km(geo::RoundTo(candidate.distance_km, 2));
      out->set_eta_minutes(candidate.eta_minutes);
      *out->mutable_vehicle() = VehicleOf(candidate.driver);
      out->set_rating(candidate.driver.rating);
      *out->mutable_position() = ToProto(candidate.position);
    }
    return resp;
  });
}

GetDriverStatsResponse DriverService::GetDriverStats(const auth::Identity& caller, const GetDriverStatsRequest&) {
  return ObserveRpc("DriverService.GetDriverStats", &caller, [&] {
    RequireRole(caller, auth::Role::kDriver, "read driver stats");

    auto       tx     = ctx_.repository->Begin();
    const auto driver = LoadDriver(*ctx_.repository, *tx, caller.id);
    const auto stats  = ctx_.repository->GetDriverOrderStats(*tx, caller.id);

    GetDriverStatsResponse resp;
    resp.set_total_rides(driver.total_rides);
    resp.set_total_deliveries(driver.total_deliveries);
    resp.set_rating(driver.rating);
    resp.set_total_earnings(geo::RoundTo(stats.earnings, 2));
    resp.set_completion_rate(stats.assigned == 0 ? 1.0 : geo::RoundTo(static_cast<double>(stats.completed) / static_cast<double>(stats.assigned), 2));
    return resp;
  });
}

} // namespace dispatch::service
