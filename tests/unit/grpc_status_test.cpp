#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>
#include <grpcpp/test/server_context_test_spouse.h>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/order_server.hpp"
#include "internal/util/errors.hpp"
#include "service_fixture.hpp"

namespace {

using namespace dispatch;
using dispatch::testing::ServiceFixture;

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.rfind(prefix, 0) == 0;
}

void SetCaller(::grpc::ServerContext& ctx, const std::string& identity, const std::string& role) {
  ::grpc::testing::ServerContextTestSpouse spouse(&ctx);
  spouse.AddClientMetadata("x-identity", identity);
  spouse.AddClientMetadata("x-role", role);
}

void TestErrorClassesMapToStatusCodes() {
  struct Case {
    ::grpc::Status     status;
    ::grpc::StatusCode code;
    std::string        prefix;
  };

  const Case cases[] = {
      {dispatch::grpc::ToStatus(util::OrderNotFound("o-1")), ::grpc::StatusCode::NOT_FOUND, "ORDER_NOT_FOUND: "},
      {dispatch::grpc::ToStatus(util::DriverAlreadyExists("d-1")), ::grpc::StatusCode::ALREADY_EXISTS, "DRIVER_ALREADY_EXISTS: "},
      {dispatch::grpc::ToStatus(util::OrderNoLongerAvailable("o-1")), ::grpc::StatusCode::ABORTED, "ORDER_NO_LONGER_AVAILABLE: "},
      {dispatch::grpc::ToStatus(util::InvalidOtp()), ::grpc::StatusCode::INVALID_ARGUMENT, "INVALID_OTP: "},
      {dispatch::grpc::ToStatus(util::DriverOffline("offline")), ::grpc::StatusCode::FAILED_PRECONDITION, "DRIVER_OFFLINE: "},
      {dispatch::grpc::ToStatus(util::Unauthorized("who")), ::grpc::StatusCode::UNAUTHENTICATED, "UNAUTHORIZED: "},
      {dispatch::grpc::ToStatus(util::Forbidden("no")), ::grpc::StatusCode::PERMISSION_DENIED, "FORBIDDEN: "},
      {dispatch::grpc::ToStatus(std::runtime_error("disk on fire")), ::grpc::StatusCode::INTERNAL, "INTERNAL_ERROR: "},
  };

  for (const auto& c : cases) {
    assert(c.status.error_code() == c.code);
    assert(StartsWith(c.status.error_message(), c.prefix));
  }
  assert(dispatch::grpc::ToStatus(util::OrderNotFound("o-1")).error_message() == "ORDER_NOT_FOUND: order o-1 not found");
}

void TestMissingIdentityIsUnauthenticated() {
  ServiceFixture              f;
  dispatch::grpc::OrderServer server(f.orders, std::make_shared<auth::MetadataIdentityVerifier>());

  ::grpc::ServerContext ctx;
  services::v1::GetOrderRequest  req;
  services::v1::GetOrderResponse resp;
  req.set_order_id("o-1");

  const auto status = server.GetOrder(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(StartsWith(status.error_message(), "UNAUTHORIZED: "));

  ::grpc::ServerContext bad_role;
  SetCaller(bad_role, "someone", "admin");
  assert(server.GetOrder(&bad_role, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestOrderServerMapsServiceErrors() {
  ServiceFixture              f;
  dispatch::grpc::OrderServer server(f.orders, std::make_shared<auth::MetadataIdentityVerifier>());

  {
    ::grpc::ServerContext ctx;
    SetCaller(ctx, "rider-1", "rider");
    services::v1::GetOrderRequest  req;
    services::v1::GetOrderResponse resp;
    req.set_order_id("missing");
    const auto status = server.GetOrder(&ctx, &req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
    assert(StartsWith(status.error_message(), "ORDER_NOT_FOUND: "));
  }
  {
    ::grpc::ServerContext ctx;
    SetCaller(ctx, "drv-1", "driver");
    auto                              req = ServiceFixture::RideRequest();
    services::v1::CreateOrderResponse resp;
    assert(server.CreateOrder(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }
  {
    ::grpc::ServerContext ctx;
    SetCaller(ctx, "rider-1", "rider");
    auto req = ServiceFixture::RideRequest();
    req.mutable_pickup()->mutable_point()->set_latitude(120);
    services::v1::CreateOrderResponse resp;
    const auto                        status = server.CreateOrder(&ctx, &req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
    assert(StartsWith(status.error_message(), "INVALID_INPUT: "));
  }
  {
    ::grpc::ServerContext ctx;
    SetCaller(ctx, "rider-1", "rider");
    auto                              req = ServiceFixture::RideRequest();
    services::v1::CreateOrderResponse resp;
    assert(server.CreateOrder(&ctx, &req, &resp).ok());
    assert(resp.order().status() == core::v1::ORDER_STATUS_PENDING);
    assert(resp.order().otp().size() == 4);
  }
}

void TestDriverServerRejectsUnknownDriver() {
  ServiceFixture               f;
  dispatch::grpc::DriverServer server(f.drivers, std::make_shared<auth::MetadataIdentityVerifier>());

  ::grpc::ServerContext ctx;
  SetCaller(ctx, "drv-ghost", "driver");
  services::v1::ReportLocationRequest  req;
  services::v1::ReportLocationResponse resp;
  req.set_latitude(-33.86);
  req.set_longitude(151.20);

  const auto status = server.ReportLocation(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(StartsWith(status.error_message(), "DRIVER_NOT_FOUND: "));
}

void TestAdminServerNeedsNoIdentity() {
  ServiceFixture              f;
  dispatch::grpc::AdminServer server(f.admin);

  ::grpc::ServerContext          ctx;
  services::v1::GetStatsRequest  stats_req;
  services::v1::GetStatsResponse stats;
  assert(server.GetStats(&ctx, &stats_req, &stats).ok());
  assert(stats.instance_id() == "node-test");
  assert(stats.geo_primary_healthy());

  services::v1::BroadcastOrderRequest req;
  google::protobuf::Empty             empty;
  assert(server.BroadcastOrder(&ctx, &req, &empty).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_order_id("missing");
  const auto status = server.BroadcastOrder(&ctx, &req, &empty);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestErrorClassesMapToStatusCodes();
  TestMissingIdentityIsUnauthenticated();
  TestOrderServerMapsServiceErrors();
  TestDriverServerRejectsUnknownDriver();
  TestAdminServerNeedsNoIdentity();
  std::cout << "grpc_status_test: pass\n";
  return 0;
}
