#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/services/v1/driver_service.grpc.pb.h"
#include "internal/auth/identity.hpp"
#include "internal/service/driver_service.hpp"

namespace dispatch::grpc {

class DriverServer final : public dispatch::services::v1::DriverService::Service {
 public:
  DriverServer(std::shared_ptr<dispatch::service::DriverService> svc, std::shared_ptr<auth::IdentityVerifier> verifier);

  ::grpc::Status RegisterDriver(::grpc::ServerContext*, const dispatch::services::v1::RegisterDriverRequest*,
                                dispatch::services::v1::RegisterDriverResponse*) override;

  ::grpc::Status GetDriver(::grpc::ServerContext*, const dispatch::services::v1::GetDriverRequest*,
                           dispatch::services::v1::GetDriverResponse*) override;

  ::grpc::Status SetAvailability(::grpc::ServerContext*, const dispatch::services::v1::SetAvailabilityRequest*,
                                 dispatch::services::v1::SetAvailabilityResponse*) override;

  ::grpc::Status ReportLocation(::grpc::ServerContext*, const dispatch::services::v1::ReportLocationRequest*,
                                dispatch::services::v1::ReportLocationResponse*) override;

  ::grpc::Status FindNearbyDrivers(::grpc::ServerContext*, const dispatch::services::v1::FindNearbyDriversRequest*,
                                   dispatch::services::v1::FindNearbyDriversResponse*) override;

  ::grpc::Status GetDriverStats(::grpc::ServerContext*, const dispatch::services::v1::GetDriverStatsRequest*,
                                dispatch::services::v1::GetDriverStatsResponse*) override;

 private:
  std::shared_ptr<dispatch::service::DriverService> service_;
  std::shared_ptr<auth::IdentityVerifier>           verifier_;
};

} // namespace dispatch::grpc
