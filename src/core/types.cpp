#include "core/types.hpp"

#include <array>
#include <cstdio>
#include <random>

namespace conductor {

std::string UUID::generate() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<uint64_t> dist;

  std::array<uint8_t, 16> bytes{};
  uint64_t hi = dist(rng);
  uint64_t lo = dist(rng);
  for (int i = 0; i < 8; ++i) {
    bytes[i] = static_cast<uint8_t>(hi >> (56 - i * 8));
    bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - i * 8));
  }

  // Version 4, variant 10xx
  bytes[6] = (bytes[6] & 0x0f) | 0x40;
  bytes[8] = (bytes[8] & 0x3f) | 0x80;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", bytes[0], bytes[1], bytes[2],
                bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                bytes[15]);
  return std::string(buf, 36);
}

}  // namespace conductor
