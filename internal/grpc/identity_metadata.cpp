#include "identity_metadata.hpp"

#include <string>

namespace dispatch::grpc {

namespace {

std::string Header(const ClientMetadata& metadata, const char* key) {
  const auto it = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace

auth::Identity Authenticate(const ClientMetadata& metadata, const auth::IdentityVerifier& verifier) {
  return verifier.Verify(Header(metadata, kIdentityHeader), Header(metadata, kRoleHeader));
}

} // namespace dispatch::grpc
