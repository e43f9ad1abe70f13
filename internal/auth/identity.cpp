#include "identity.hpp"

#include "internal/util/errors.hpp"

namespace dispatch::auth {

const char* ToString(Role role) {
  switch (role) {
    case Role::kRider:
      return "rider";
    case Role::kDriver:
      return "driver";
  }
  return "unknown";
}

std::optional<Role> ParseRole(const std::string& text) {
  if (text == "rider") return Role::kRider;
  if (text == "driver") return Role::kDriver;
  return std::nullopt;
}

Identity MetadataIdentityVerifier::Verify(const std::string& id, const std::string& role) const {
  if (id.empty()) {
    throw util::Unauthorized("missing caller identity");
  }

  const auto parsed = ParseRole(role);
  if (!parsed) {
    throw util::Unauthorized("unknown caller role '" + role + "'");
  }

  return Identity{id, *parsed};
}

} // namespace dispatch::auth
