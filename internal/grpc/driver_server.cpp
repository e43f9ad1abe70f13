#include "driver_server.hpp"

#include "identity_metadata.hpp"

namespace dispatch::grpc {

using namespace dispatch::services::v1;

DriverServer::DriverServer(std::shared_ptr<dispatch::service::DriverService> svc, std::shared_ptr<auth::IdentityVerifier> verifier)
    : service_(std::move(svc)), verifier_(std::move(verifier)) {
}

::grpc::Status DriverServer::RegisterDriver(::grpc::ServerContext* ctx, const RegisterDriverRequest* req, RegisterDriverResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->RegisterDriver(caller, *req); });
}

::grpc::Status DriverServer::GetDriver(::grpc::ServerContext* ctx, const GetDriverRequest* req, GetDriverResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->GetDriver(caller, *req); });
}

::grpc::Status DriverServer::SetAvailability(::grpc::ServerContext* ctx, const SetAvailabilityRequest* req, SetAvailabilityResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->SetAvailability(caller, *req); });
}

::grpc::Status DriverServer::ReportLocation(::grpc::ServerContext* ctx, const ReportLocationRequest* req, ReportLocationResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->ReportLocation(caller, *req); });
}

::grpc::Status DriverServer::FindNearbyDrivers(::grpc::ServerContext* ctx, const FindNearbyDriversRequest* req, FindNearbyDriversResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->FindNearbyDrivers(caller, *req); });
}

::grpc::Status DriverServer::GetDriverStats(::grpc::ServerContext* ctx, const GetDriverStatsRequest* req, GetDriverStatsResponse* resp) {
  return AuthenticatedCall(ctx, *verifier_, [&](const auth::Identity& caller) { *resp = service_->GetDriverStats(caller, *req); });
}

} // namespace dispatch::grpc
