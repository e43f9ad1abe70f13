#pragma once

#include "dispatch/services/v1/order_service.pb.h"
#include "internal/auth/identity.hpp"
#include "service_context.hpp"

namespace dispatch::service {

class OrderService {
 public:
  explicit OrderService(ServiceContext ctx);

  dispatch::services::v1::EstimateResponse Estimate(const auth::Identity& caller, const dispatch::services::v1::EstimateRequest& req);

  dispatch::services::v1::CreateOrderResponse CreateOrder(const auth::Identity& caller, const dispatch::services::v1::CreateOrderRequest& req);

  dispatch::services::v1::AcceptOrderResponse AcceptOrder(const auth::Identity& caller, const dispatch::services::v1::AcceptOrderRequest& req);

  void DeclineOrder(const auth::Identity& caller, const dispatch::services::v1::DeclineOrderRequest& req);

  dispatch::services::v1::UpdateOrderStatusResponse UpdateOrderStatus(const auth::Identity&                              caller,
                                                                      const dispatch::services::v1::UpdateOrderStatusRequest& req);

  dispatch::services::v1::CancelOrderResponse CancelOrder(const auth::Identity& caller, const dispatch::services::v1::CancelOrderRequest& req);

  dispatch::services::v1::GetOrderResponse GetOrder(const auth::Identity& caller, const dispatch::services::v1::GetOrderRequest& req);

  dispatch::services::v1::GetActiveOrderResponse GetActiveOrder(const auth::Identity& caller, const dispatch::services::v1::GetActiveOrderRequest& req);

  dispatch::services::v1::ListOrderHistoryResponse ListOrderHistory(const auth::Identity&                             caller,
                                                                    const dispatch::services::v1::ListOrderHistoryRequest& req);

  dispatch::services::v1::ListOrderEventsResponse ListOrderEvents(const auth::Identity&                            caller,
                                                                  const dispatch::services::v1::ListOrderEventsRequest& req);

  void RateOrder(const auth::Identity& caller, const dispatch::services::v1::RateOrderRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
