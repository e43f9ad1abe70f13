#include "ids.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>

namespace dispatch::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string NewId() {
  std::array<uint8_t, 16> b{};
  const uint64_t          hi = Rng()();
  const uint64_t          lo = Rng()();
  for (size_t i = 0; i < 8; ++i) {
    b[i]     = static_cast<uint8_t>(hi >> (i * 8));
    b[i + 8] = static_cast<uint8_t>(lo >> (i * 8));
  }
  b[6] = (b[6] & 0x0F) | 0x40; // version 4
  b[8] = (b[8] & 0x3F) | 0x80; // RFC 4122 variant

  char out[37];
  std::snprintf(out, sizeof(out), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", b[0], b[1], b[2], b[3], b[4], b[5],
                b[6], b[7], b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
  return out;
}

std::string NewOtp() {
  std::uniform_int_distribution<int> digits(1000, 9999);
  return std::to_string(digits(Rng()));
}

} // namespace dispatch::util
