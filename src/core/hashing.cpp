#include "prefixid/core/hashing.h"

namespace prefixid::core {

std::uint64_t fnv1a_64(const std::string_view input) {
  constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffsetBasis;
  for (const char ch : input) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kPrime;
  }
  return hash;
}

std::string to_hex64(std::uint64_t value) {
  constexpr std::string_view kDigits = "0123456789abcdef";

  std::string out(16, '0');
  for (auto it = out.rbegin(); it != out.rend(); ++it) {
    *it = kDigits[value & 0xfu];
    value >>= 4;
  }
  return out;
}

}  // namespace prefixid::core
