#pragma once

#include <optional>
#include <string>

namespace dispatch::auth {

enum class Role {
  kRider,
  kDriver,
};

struct Identity {
  std::string id;
  Role        role = Role::kRider;
};

const char*         ToString(Role role);
std::optional<Role> ParseRole(const std::string& text);

/*
  Verifies the identity a caller presents. Credential issuance and
  resolution live outside this service; a deployment plugs its own
  verifier in here.
*/
class IdentityVerifier {
 public:
  virtual ~IdentityVerifier() = default;

  // Throws util::Unauthorized when the presented identity is not acceptable.
  virtual Identity Verify(const std::string& id, const std::string& role) const = 0;
};

// Accepts any non-empty id with a known role.
class MetadataIdentityVerifier final : public IdentityVerifier {
 public:
  Identity Verify(const std::string& id, const std::string& role) const override;
};

} // namespace dispatch::auth
