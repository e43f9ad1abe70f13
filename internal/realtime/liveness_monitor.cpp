#include "liveness_monitor.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "realtime_gateway.hpp"

namespace dispatch::realtime {

LivenessMonitor::LivenessMonitor(std::shared_ptr<RealtimeGateway> gateway) : gateway_(std::move(gateway)) {
}

LivenessMonitor::~LivenessMonitor() {
  Stop();
}

void LivenessMonitor::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&LivenessMonitor::Loop, this);
}

void LivenessMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LivenessMonitor::Loop() {
  const auto interval = std::chrono::milliseconds(gateway_->Options().heartbeat_interval_ms);

  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval, [this] { return !running_; })) break;

    lock.unlock();
    try {
      gateway_->SweepLiveness(std::chrono::steady_clock::now());
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("liveness sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace dispatch::realtime
