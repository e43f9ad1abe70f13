#pragma once

#include <map>

#include <grpcpp/grpcpp.h>

#include "grpc_error.hpp"
#include "internal/auth/identity.hpp"

namespace dispatch::grpc {

inline constexpr const char* kIdentityHeader = "x-identity";
inline constexpr const char* kRoleHeader     = "x-role";

using ClientMetadata = std::multimap<::grpc::string_ref, ::grpc::string_ref>;

// Resolves the caller from request metadata. Throws UNAUTHORIZED.
auth::Identity Authenticate(const ClientMetadata& metadata, const auth::IdentityVerifier& verifier);

// Runs fn(caller) for an authenticated unary call and maps any failure.
template <typename Fn>
::grpc::Status AuthenticatedCall(const ::grpc::ServerContext* ctx, const auth::IdentityVerifier& verifier, Fn&& fn) {
  return Guarded([&] { fn(Authenticate(ctx->client_metadata(), verifier)); });
}

} // namespace dispatch::grpc
