#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/order_service.grpc.pb.h"
#include "internal/auth/identity.hpp"
#include "internal/service/order_service.hpp"

namespace dispatch::grpc {

class OrderServer final : public dispatch::services::v1::OrderService::Service {
 public:
  OrderServer(std::shared_ptr<dispatch::service::OrderService> svc, std::shared_ptr<auth::IdentityVerifier> verifier);

  ::grpc::Status Estimate(::grpc::ServerContext*, const dispatch::services::v1::EstimateRequest*, dispatch::services::v1::EstimateResponse*) override;

  ::grpc::Status CreateOrder(::grpc::ServerContext*, const dispatch::services::v1::CreateOrderRequest*,
                             dispatch::services::v1::CreateOrderResponse*) override;

  ::grpc::Status AcceptOrder(::grpc::ServerContext*, const dispatch::services::v1::AcceptOrderRequest*,
                             dispatch::services::v1::AcceptOrderResponse*) override;

  ::grpc::Status DeclineOrder(::grpc::ServerContext*, const dispatch::services::v1::DeclineOrderRequest*, google::protobuf::Empty*) override;

  ::grpc::Status UpdateOrderStatus(::grpc::ServerContext*, const dispatch::services::v1::UpdateOrderStatusRequest*,
                                   dispatch::services::v1::UpdateOrderStatusResponse*) override;

  ::grpc::Status CancelOrder(::grpc::ServerContext*, const dispatch::services::v1::CancelOrderRequest*,
                             dispatch::services::v1::CancelOrderResponse*) override;

  ::grpc::Status GetOrder(::grpc::ServerContext*, const dispatch::services::v1::GetOrderRequest*, dispatch::services::v1::GetOrderResponse*) override;

  ::grpc::Status GetActiveOrder(::grpc::ServerContext*, const dispatch::services::v1::GetActiveOrderRequest*,
                                dispatch::services::v1::GetActiveOrderResponse*) override;

  ::grpc::Status ListOrderHistory(::grpc::ServerContext*, const dispatch::services::v1::ListOrderHistoryRequest*,
                                  dispatch::services::v1::ListOrderHistoryResponse*) override;

  ::grpc::Status ListOrderEvents(::grpc::ServerContext*, const dispatch::services::v1::ListOrderEventsRequest*,
                                 dispatch::services::v1::ListOrderEventsResponse*) override;

  ::grpc::Status RateOrder(::grpc::ServerContext*, const dispatch::services::v1::RateOrderRequest*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<dispatch::service::OrderService> service_;
  std::shared_ptr<auth::IdentityVerifier>          verifier_;
};

} // namespace dispatch::grpc
