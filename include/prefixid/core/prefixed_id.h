#pragma once

#include "prefixid/core/result.h"
#include "prefixid/core/uuid_source.h"

#include <optional>
#include <string>
#include <string_view>

namespace prefixid::core {

// Accepted range for the hex suffix length. The upper bound is the full hex
// length of a 128-bit value.
constexpr int kMinHexLength = 1;
constexpr int kMaxHexLength = static_cast<int>(kUuidHexLength);

// Identifier format: "{prefix}_{hex}" where hex is the leading hex_length
// characters of a fresh 128-bit value from the source, e.g. "char_a1b2c3d4e5f6".
//
// Request rules:
//   prefix      non-empty and not whitespace-only
//   hex_length  in [kMinHexLength, kMaxHexLength]
// The prefix is otherwise used verbatim.

// validate_id_request checks the request without touching any source.
// Returns nullopt when the request is valid.
[[nodiscard]] std::optional<IdError> validate_id_request(std::string_view prefix, int hex_length);

// try_generate_id validates first and draws from the source only on success.
// A source value that is not kUuidHexLength lowercase hex characters is a
// broken source, not a bad request: that throws std::runtime_error.
[[nodiscard]] Result<std::string, IdError> try_generate_id(IUuidSource& source,
                                                           std::string_view prefix,
                                                           int hex_length);

// generate_id throws std::invalid_argument on an invalid request.
[[nodiscard]] std::string generate_id(IUuidSource& source, std::string_view prefix,
                                      int hex_length);

// Same as above, drawing from system_uuid_source().
[[nodiscard]] std::string generate_id(std::string_view prefix, int hex_length);

// id_error_to_string returns a stable, human-readable description.
[[nodiscard]] std::string id_error_to_string(IdError error);

}  // namespace prefixid::core
