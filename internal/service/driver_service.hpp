#pragma once

#include "dispatch/services/v1/driver_service.pb.h"
#include "internal/auth/identity.hpp"
#include "service_context.hpp"

namespace dispatch::service {

class DriverService {
 public:
  explicit DriverService(ServiceContext ctx);

  dispatch::services::v1::RegisterDriverResponse RegisterDriver(const auth::Identity&                           caller,
                                                                const dispatch::services::v1::RegisterDriverRequest& req);

  dispatch::services::v1::GetDriverResponse GetDriver(const auth::Identity& caller, const dispatch::services::v1::GetDriverRequest& req);

  dispatch::services::v1::SetAvailabilityResponse SetAvailability(const auth::Identity&                            caller,
                                                                  const dispatch::services::v1::SetAvailabilityRequest& req);

  dispatch::services::v1::ReportLocationResponse ReportLocation(const auth::Identity&                           caller,
                                                                const dispatch::services::v1::ReportLocationRequest& req);

  dispatch::services::v1::FindNearbyDriversResponse FindNearbyDrivers(const auth::Identity&                              caller,
                                                                      const dispatch::services::v1::FindNearbyDriversRequest& req);

  dispatch::services::v1::GetDriverStatsResponse GetDriverStats(const auth::Identity&                           caller,
                                                                const dispatch::services::v1::GetDriverStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
