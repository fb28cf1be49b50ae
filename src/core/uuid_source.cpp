#include "prefixid/core/uuid_source.h"

#include "prefixid/core/hashing.h"

#include <uuid/uuid.h>

#include <algorithm>
#include <stdexcept>

namespace prefixid::core {

std::string SystemUuidSource::next_uuid_hex() {
  uuid_t uu;
  uuid_generate_random(uu);

  // 36 characters plus terminator: 8-4-4-4-12.
  char buffer[37];  // NOLINT(modernize-avoid-c-arrays)
  uuid_unparse_lower(uu, buffer);

  std::string hex(buffer);
  hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());
  if (hex.size() != kUuidHexLength) {
    throw std::runtime_error("SystemUuidSource: unexpected uuid text '" + std::string(buffer) +
                             "'");
  }
  return hex;
}

std::string DeterministicUuidSource::next_uuid_hex() {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  const std::string base = seed_ + ":" + std::to_string(c);
  return to_hex64(fnv1a_64(base + ":hi")) + to_hex64(fnv1a_64(base + ":lo"));
}

IUuidSource& system_uuid_source() {
  static SystemUuidSource source;
  return source;
}

}  // namespace prefixid::core
