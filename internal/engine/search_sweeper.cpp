#include "search_sweeper.hpp"

#include <chrono>

#include "dispatch_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace dispatch::engine {

SearchSweeper::SearchSweeper(std::shared_ptr<DispatchEngine> engine, uint32_t interval_ms, std::function<uint64_t()> clock)
    : engine_(std::move(engine)), interval_ms_(interval_ms == 0 ? 1000 : interval_ms), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return util::NowMillis(); };
  }
}

SearchSweeper::~SearchSweeper() {
  Stop();
}

void SearchSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&SearchSweeper::Run, this);
}

void SearchSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

size_t SearchSweeper::RunOnce() {
  return engine_->SweepExpiredSearches(clock_());
}

void SearchSweeper::Run() {
  const auto interval = std::chrono::milliseconds(interval_ms_);

  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval, [this] { return !running_; })) break;

    lock.unlock();
    try {
      const auto handled = RunOnce();
      if (handled > 0) {
        DISPATCH_LOG_DEBUG("search sweep", {observability::IntField("expired", static_cast<std::int64_t>(handled))});
      }
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("search sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace dispatch::engine
