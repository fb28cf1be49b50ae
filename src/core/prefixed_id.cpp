#include "prefixid/core/prefixed_id.h"

#include <algorithm>
#include <stdexcept>

namespace prefixid::core {

namespace {

bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_lower_hex(const char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

}  // namespace

std::optional<IdError> validate_id_request(const std::string_view prefix, const int hex_length) {
  if (std::all_of(prefix.begin(), prefix.end(), is_ascii_space)) {
    // Also covers the empty prefix.
    return IdError::kEmptyPrefix;
  }
  if (hex_length < kMinHexLength || hex_length > kMaxHexLength) {
    return IdError::kHexLengthOutOfRange;
  }
  return std::nullopt;
}

Result<std::string, IdError> try_generate_id(IUuidSource& source, const std::string_view prefix,
                                             const int hex_length) {
  if (const auto error = validate_id_request(prefix, hex_length)) {
    return Result<std::string, IdError>::err(*error);
  }

  const std::string hex = source.next_uuid_hex();
  if (hex.size() != kUuidHexLength || !std::all_of(hex.begin(), hex.end(), is_lower_hex)) {
    throw std::runtime_error("try_generate_id: source returned malformed value '" + hex + "'");
  }

  std::string id;
  id.reserve(prefix.size() + 1 + static_cast<std::size_t>(hex_length));
  id.append(prefix);
  id.push_back('_');
  id.append(hex, 0, static_cast<std::size_t>(hex_length));
  return Result<std::string, IdError>::ok(std::move(id));
}

std::string generate_id(IUuidSource& source, const std::string_view prefix, const int hex_length) {
  auto result = try_generate_id(source, prefix, hex_length);
  if (!result.has_value()) {
    throw std::invalid_argument(id_error_to_string(result.error()) + " (prefix='" +
                                std::string(prefix) +
                                "', hex_length=" + std::to_string(hex_length) + ")");
  }
  return result.value();
}

std::string generate_id(const std::string_view prefix, const int hex_length) {
  return generate_id(system_uuid_source(), prefix, hex_length);
}

std::string id_error_to_string(const IdError error) {
  switch (error) {
    case IdError::kEmptyPrefix:
      return "prefix must not be empty or blank";
    case IdError::kHexLengthOutOfRange:
      return "hex_length must be between " + std::to_string(kMinHexLength) + " and " +
             std::to_string(kMaxHexLength);
  }
  return "unknown id error";
}

}  // namespace prefixid::core
