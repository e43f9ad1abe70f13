#pragma once

#include <memory>
#include <string>

#include "internal/auth/identity.hpp"

namespace dispatch::db {
class Repository;
}
namespace dispatch::engine {
class DispatchEngine;
}
namespace dispatch::geo {
class GeoIndex;
}
namespace dispatch::realtime {
class RealtimeGateway;
}
namespace dispatch::tracking {
class LocationTracker;
}

namespace dispatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<dispatch::db::Repository>            repository;
  std::shared_ptr<dispatch::engine::DispatchEngine>    engine;
  std::shared_ptr<dispatch::geo::GeoIndex>             geo;
  std::shared_ptr<dispatch::tracking::LocationTracker> tracker;
  std::shared_ptr<dispatch::realtime::RealtimeGateway> gateway;
  std::string                                          instance_id;
};

// Throws FORBIDDEN unless the caller holds the role.
void RequireRole(const auth::Identity& caller, auth::Role role, const char* action);

} // namespace dispatch::service
