#include "local_cluster_bus.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::cluster {

using dispatch::observability::StringField;

void LocalClusterBus::Publish(const std::string& topic, const std::string& payload) {
  std::vector<Handler> handlers;
  {
    std::lock_guard lock(mutex_);
    auto            it = handlers_.find(topic);
    if (it == handlers_.end()) return;
    handlers = it->second;
  }

  for (const auto& handler : handlers) {
    try {
      handler(payload);
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("bus handler failed", {StringField("topic", topic), StringField("error", e.what())});
    }
  }
}

void LocalClusterBus::Subscribe(const std::string& topic, Handler handler) {
  std::lock_guard lock(mutex_);
  handlers_[topic].push_back(std::move(handler));
}

} // namespace dispatch::cluster
