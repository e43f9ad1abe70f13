#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace dispatch::realtime {

class RealtimeGateway;

/*
  Periodically heartbeats the gateway's connections and reaps the silent
  ones.
*/
class LivenessMonitor {
 public:
  explicit LivenessMonitor(std::shared_ptr<RealtimeGateway> gateway);
  ~LivenessMonitor();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<RealtimeGateway> gateway_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace dispatch::realtime
