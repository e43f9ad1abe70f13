#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace dispatch::async {
class TaskWorker;
}
namespace dispatch::engine {
class SearchSweeper;
}
namespace dispatch::realtime {
class LivenessMonitor;
}

namespace dispatch::factory {

/*
  Application

  Everything the process keeps alive between start and shutdown. The
  gRPC services are handed to the server; the background workers stay
  here until Stop().
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<async::TaskWorker>         worker;
  std::shared_ptr<engine::SearchSweeper>     sweeper;
  std::shared_ptr<realtime::LivenessMonitor> liveness;

  // Call after the gRPC server stopped.
  void Stop();
};

/*
  Build

  Composition root. The only place that knows concrete repository, geo
  backend and bus types.
*/
Application Build(const dispatch::runtime::config::RuntimeConfig& config);

} // namespace dispatch::factory
