#include "uuid.hpp"

#include <cstdint>
#include <random>

namespace bidsub::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::mt19937_64& ThreadRng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string GenerateUUIDString() {
  auto&    rng = ThreadRng();
  uint64_t hi  = rng();
  uint64_t lo  = rng();

  hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull; // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // RFC 4122 variant

  std::string out;
  out.reserve(36);
  for (int nibble = 15; nibble >= 0; --nibble) {
    out.push_back(kHex[(hi >> (nibble * 4)) & 0xF]);
    if (nibble == 8 || nibble == 4) out.push_back('-');
  }
  out.push_back('-');
  for (int nibble = 15; nibble >= 0; --nibble) {
    out.push_back(kHex[(lo >> (nibble * 4)) & 0xF]);
    if (nibble == 12) out.push_back('-');
  }
  return out;
}

} // namespace bidsub::util
