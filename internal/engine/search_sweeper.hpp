#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace dispatch::engine {

class DispatchEngine;

/*
  Background worker driving the durable accept timer.

  Every process runs one. Each tick hands the current time to
  DispatchEngine::SweepExpiredSearches, whose compare-and-set claim lets
  exactly one process handle a given expiry.
*/
class SearchSweeper {
 public:
  SearchSweeper(std::shared_ptr<DispatchEngine> engine, uint32_t interval_ms, std::function<uint64_t()> clock = {});
  ~SearchSweeper();

  void Start();
  void Stop();

  // One sweep on the caller's thread.
  size_t RunOnce();

 private:
  void Run();

  std::shared_ptr<DispatchEngine> engine_;
  uint32_t                        interval_ms_;
  std::function<uint64_t()>       clock_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace dispatch::engine
