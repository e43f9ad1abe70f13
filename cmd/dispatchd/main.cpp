#include <pthread.h>

#include <csignal>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

using dispatch::observability::StringField;

struct Options {
  std::string config_path;
  std::string instance_id;
};

void PrintUsage() {
  std::cerr << "usage: dispatchd --config <file.yaml> [--instance-id <id>]\n"
               "       dispatchd <file.yaml>\n";
}

bool ParseArgs(int argc, char** argv, Options& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "--instance-id") && i + 1 < argc) {
      (arg == "--config" ? out.config_path : out.instance_id) = argv[++i];
    } else if (arg.rfind("--", 0) != 0 && out.config_path.empty()) {
      out.config_path = arg;
    } else {
      return false;
    }
  }
  return !out.config_path.empty();
}

// Blocks SIGINT and SIGTERM in every thread started afterwards; main collects them with sigwait.
sigset_t BlockShutdownSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

void ShutdownObservability() {
  dispatch::observability::ShutdownMetrics();
  dispatch::observability::ShutdownTracing();
  dispatch::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, options)) {
    PrintUsage();
    return 1;
  }

  const sigset_t shutdown_signals = BlockShutdownSignals();

  try {
    auto config = dispatch::config::ConfigLoader::LoadFromYaml(options.config_path);
    if (!options.instance_id.empty()) {
      config.mutable_server()->set_instance_id(options.instance_id);
    }

    dispatch::observability::InitializeLogging(config);
    dispatch::observability::InitializeTracing(config);
    dispatch::observability::InitializeMetrics(config);

    auto app = dispatch::factory::Build(config);

    dispatch::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    DISPATCH_LOG_INFO("dispatchd serving", {StringField("bind_address", config.server().bind_address()),
                                            StringField("instance_id", config.server().instance_id()),
                                            StringField("config", options.config_path)});

    int signal = 0;
    sigwait(&shutdown_signals, &signal);
    DISPATCH_LOG_INFO("dispatchd stopping", {StringField("signal", signal == SIGINT ? "SIGINT" : "SIGTERM")});

    server.Stop();
    app.Stop();
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("dispatchd failed", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  ShutdownObservability();
  return 0;
}
