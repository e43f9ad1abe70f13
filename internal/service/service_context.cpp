#include "service_context.hpp"

#include "internal/util/errors.hpp"

namespace dispatch::service {

void RequireRole(const auth::Identity& caller, auth::Role role, const char* action) {
  if (caller.role != role) {
    throw util::Forbidden(std::string("only a ") + auth::ToString(role) + " may " + action);
  }
}

} // namespace dispatch::service
