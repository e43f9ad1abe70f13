#include "order_server.hpp"

#include "identity_metadata.hpp"

namespace dispatch::grpc {

using namespace dispatch::services::v1;

OrderServer::OrderServer(std::shared_ptr<dispatch::service::OrderService> svc, std::shared_ptr<auth::IdentityVerifier> verifier)
    : service_(std::move(svc)), verifier_(std::move(verifier)) {
}

::grpc::Status OrderServer::Estimate(::grpc::ServerContext* ctx, const EstimateRequest* req, EstimateResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->Estimate(caller, *req); });
}

::grpc::Status OrderServer::CreateOrder(::grpc::ServerContext* ctx, const CreateOrderRequest* req, CreateOrderResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->CreateOrder(caller, *req); });
}

::grpc::Status OrderServer::AcceptOrder(::grpc::ServerContext* ctx, const AcceptOrderRequest* req, AcceptOrderResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->AcceptOrder(caller, *req); });
}

::grpc::Status OrderServer::DeclineOrder(::grpc::ServerContext* ctx, const DeclineOrderRequest* req, google::protobuf::Empty*) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { service_->DeclineOrder(caller, *req); });
}

::grpc::Status OrderServer::UpdateOrderStatus(::grpc::ServerContext* ctx, const UpdateOrderStatusRequest* req, UpdateOrderStatusResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->UpdateOrderStatus(caller, *req); });
}

::grpc::Status OrderServer::CancelOrder(::grpc::ServerContext* ctx, const CancelOrderRequest* req, CancelOrderResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->CancelOrder(caller, *req); });
}

::grpc::Status OrderServer::GetOrder(::grpc::ServerContext* ctx, const GetOrderRequest* req, GetOrderResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->GetOrder(caller, *req); });
}

::grpc::Status OrderServer::GetActiveOrder(::grpc::ServerContext* ctx, const GetActiveOrderRequest* req, GetActiveOrderResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->GetActiveOrder(caller, *req); });
}

::grpc::Status OrderServer::ListOrderHistory(::grpc::ServerContext* ctx, const ListOrderHistoryRequest* req, ListOrderHistoryResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->ListOrderHistory(caller, *req); });
}

::grpc::Status OrderServer::ListOrderEvents(::grpc::ServerContext* ctx, const ListOrderEventsRequest* req, ListOrderEventsResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->ListOrderEvents(caller, *req); });
}

::grpc::Status OrderServer::RateOrder(::grpc::ServerContext* ctx, const RateOrderRequest* req, google::protobuf::Empty*) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { service_->RateOrder(caller, *req); });
}

} // namespace dispatch::grpc
