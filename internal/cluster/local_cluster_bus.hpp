#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "cluster_bus.hpp"

namespace dispatch::cluster {

/*
  Single-process bus. Handlers run synchronously on the publishing
  thread; a throwing handler is logged and skipped.
*/
class LocalClusterBus final : public ClusterBus {
 public:
  void Publish(const std::string& topic, const std::string& payload) override;
  void Subscribe(const std::string& topic, Handler handler) override;

 private:
  std::mutex                                            mutex_;
  std::unordered_map<std::string, std::vector<Handler>> handlers_;
};

} // namespace dispatch::cluster
