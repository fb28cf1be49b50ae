#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace prefixid::core {

// fnv1a_64 is the 64-bit FNV-1a hash. Not cryptographic; it only spreads
// reproducible inputs (seed, counter) across the full 64-bit range.
std::uint64_t fnv1a_64(std::string_view input);

// to_hex64 formats a value as 16 lowercase hex digits, most significant first.
std::string to_hex64(std::uint64_t value);

}  // namespace prefixid::core
