#pragma once

#include "dispatch/services/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace dispatch::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  dispatch::services::v1::GetStatsResponse GetStats(const dispatch::services::v1::GetStatsRequest& req);

  // Offers a PENDING order to every connected driver in the cluster
  // except those who already declined it.
  void BroadcastOrder(const dispatch::services::v1::BroadcastOrderRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
