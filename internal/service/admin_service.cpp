#include "admin_service.hpp"

#include <string>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/realtime/realtime_gateway.hpp"
#include "internal/realtime/realtime_notification_sink.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::core::v1;
using namespace dispatch::services::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetStatsResponse AdminService::GetStats(const GetStatsRequest&) {
  return ObserveRpc("AdminService.GetStats", nullptr, [&] {
    const auto stats = ctx_.gateway->Stats();

    GetStatsResponse resp;
    resp.set_instance_id(ctx_.instance_id);
    resp.set_connections(stats.connections);
    resp.set_riders(stats.riders);
    resp.set_drivers(stats.drivers);
    resp.set_indexed_drivers(ctx_.geo->IndexedCount());
    resp.set_geo_primary_healthy(ctx_.geo->PrimaryHealthy());
    return resp;
  });
}

void AdminService::BroadcastOrder(const BroadcastOrderRequest& req) {
  ObserveRpc("AdminService.BroadcastOrder", nullptr, [&] {
    if (req.order_id().empty()) {
      throw util::InvalidInput("order_id is required");
    }

    std::unordered_set<std::string> declined;
    auto                            tx    = ctx_.repository->Begin();
    auto                            order = ctx_.repository->GetOrder(*tx, req.order_id());
    if (!order) {
      throw util::OrderNotFound(req.order_id());
    }
    if (order->status != ORDER_STATUS_PENDING) {
      throw util::OrderNoLongerAvailable(req.order_id());
    }
    for (const auto& decline : ctx_.repository->ListDeclines(*tx, order->id)) {
      declined.insert(decline.driver_id);
    }
    tx->Commit();

    ctx_.gateway->BroadcastToRole(auth::Role::kDriver, realtime::OfferMessage(*order, order->search_attempts), declined);
    DISPATCH_LOG_INFO("order broadcast to all drivers",
                      {observability::StringField("order_id", order->id), observability::IntField("excluded", static_cast<std::int64_t>(declined.size()))});
  });
}

} // namespace dispatch::service
