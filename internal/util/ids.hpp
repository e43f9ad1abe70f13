#pragma once

#include <string>

namespace dispatch::util {

// Random RFC 4122 version 4 UUID in canonical lowercase text form. Used for order ids.
std::string NewId();

// Four-digit pickup code, 1000..9999.
std::string NewOtp();

} // namespace dispatch::util
