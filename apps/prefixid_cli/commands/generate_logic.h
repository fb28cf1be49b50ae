#pragma once

#include "prefixid/core/result.h"
#include "prefixid/core/uuid_source.h"

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

namespace prefixid::apps {

// Upper bound for --count; larger requests are rejected as invalid input.
constexpr int kMaxCount = 100000;

// GenerateCliConfig holds the parsed flags for one generate invocation.
// kind is either a fixed kind name ("character", "user", ...) or "custom";
// for fixed kinds prefix and hex_length are filled from the kind table.
struct GenerateCliConfig {
  std::string kind;                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> prefix;  // NOLINT(readability-identifier-naming)
  std::optional<int> hex_length;      // NOLINT(readability-identifier-naming)
  int count{1};                       // NOLINT(readability-identifier-naming)
  bool json{false};                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> seed;    // NOLINT(readability-identifier-naming)
  bool valid{true};                   // NOLINT(readability-identifier-naming)
};

// generate_options returns the flag table shared by parsing and usage output.
[[nodiscard]] std::vector<Option<GenerateCliConfig>> generate_options();

// parse_generate_args reads argv[1] as the kind and argv[2..] as flags.
// Words after the kind that are not flags or flag values are rejected.
// Every problem is reported to stderr and clears config.valid; the caller
// must not generate anything from an invalid config.
[[nodiscard]] GenerateCliConfig parse_generate_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// generate_ids draws count identifiers from the source, stopping at the first error.
[[nodiscard]] core::Result<std::vector<std::string>, core::IdError> generate_ids(
    core::IUuidSource& source, const std::string& prefix, int hex_length, int count);

// render_ids_json returns the --json document, pretty-printed with 2-space indent.
[[nodiscard]] std::string render_ids_json(const GenerateCliConfig& config,
                                          const std::vector<std::string>& ids);

// render_ids_text returns one identifier per line.
[[nodiscard]] std::string render_ids_text(const std::vector<std::string>& ids);

}  // namespace prefixid::apps
