#include "generate_logic.h"

#include "prefixid/core/ids.h"
#include "prefixid/core/prefixed_id.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <iostream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace prefixid::apps {

namespace {

std::optional<int> parse_int(const std::string& value) {
  int out = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return out;
}

void mark_invalid(GenerateCliConfig& config) {
  config.valid = false;
}

// reject_positionals flags any word in argv[start..] that is neither a known
// flag nor the value consumed by one. parse_options skips such words.
void reject_positionals(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                        const std::vector<Option<GenerateCliConfig>>& options, int start,
                        GenerateCliConfig& config) {
  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const auto it = std::find_if(options.begin(), options.end(),
                                 [&arg](const auto& opt) { return opt.name == arg; });
    if (it != options.end()) {
      if (it->requires_value) {
        ++i;
      }
      continue;
    }
    if (!arg.empty() && arg[0] == '-') {
      continue;  // Reported by parse_options.
    }
    std::cerr << "Unexpected argument: " << arg << "\n";
    config.valid = false;
  }
}

bool handle_prefix(GenerateCliConfig& config, const std::string& value) {
  config.prefix = value;
  return true;
}

bool handle_length(GenerateCliConfig& config, const std::string& value) {
  const auto parsed = parse_int(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --length: " << value << " (expected an integer)\n";
    mark_invalid(config);
    return false;
  }
  config.hex_length = parsed;
  return true;
}

bool handle_count(GenerateCliConfig& config, const std::string& value) {
  const auto parsed = parse_int(value);
  if (!parsed.has_value() || parsed.value() < 1 || parsed.value() > kMaxCount) {
    std::cerr << "Invalid --count: " << value << " (expected an integer in [1, " << kMaxCount
              << "])\n";
    mark_invalid(config);
    return false;
  }
  config.count = parsed.value();
  return true;
}

bool handle_json(GenerateCliConfig& config, const std::string& /*value*/) {
  config.json = true;
  return true;
}

bool handle_seed(GenerateCliConfig& config, const std::string& value) {
  config.seed = value;
  return true;
}

}  // namespace

std::vector<Option<GenerateCliConfig>> generate_options() {
  return {
      {"--prefix", true, "Identifier prefix (custom kind only)", handle_prefix},
      {"--length", true, "Hex suffix length, 1-32 (custom kind only)", handle_length},
      {"--count", true, "Number of identifiers to print (default 1)", handle_count},
      {"--json", false, "Print a JSON document instead of plain lines", handle_json},
      {"--seed", true, "Use a deterministic source seeded with this value", handle_seed},
  };
}

GenerateCliConfig parse_generate_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  GenerateCliConfig defaults;
  if (argc < 2) {
    std::cerr << "Error: missing kind\n";
    defaults.valid = false;
    return defaults;
  }
  defaults.kind = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  const auto options = generate_options();
  auto config = parse_options<GenerateCliConfig>(argc, argv, options, 2, std::move(defaults),
                                                  mark_invalid);
  reject_positionals(argc, argv, options, 2, config);

  if (config.kind == "custom") {
    if (!config.prefix.has_value() || !config.hex_length.has_value()) {
      std::cerr << "Error: custom requires --prefix <p> and --length <n>\n";
      config.valid = false;
    }
    return config;
  }

  const auto kind = core::id_kind_from_string(config.kind);
  if (!kind.has_value()) {
    std::cerr << "Error: unknown kind '" << config.kind
              << "' (valid: character, user, story, segment, session, custom)\n";
    config.valid = false;
    return config;
  }
  if (config.prefix.has_value() || config.hex_length.has_value()) {
    std::cerr << "Error: --prefix and --length are only accepted with the custom kind\n";
    config.valid = false;
    return config;
  }

  config.prefix = std::string(kind->prefix);
  config.hex_length = kind->hex_length;
  return config;
}

core::Result<std::vector<std::string>, core::IdError> generate_ids(core::IUuidSource& source,
                                                                   const std::string& prefix,
                                                                   const int hex_length,
                                                                   const int count) {
  using IdsResult = core::Result<std::vector<std::string>, core::IdError>;

  std::vector<std::string> ids;
  for (int i = 0; i < count; ++i) {
    auto result = core::try_generate_id(source, prefix, hex_length);
    if (!result.has_value()) {
      return IdsResult::err(result.error());
    }
    ids.push_back(result.value());
  }
  return IdsResult::ok(std::move(ids));
}

std::string render_ids_json(const GenerateCliConfig& config, const std::vector<std::string>& ids) {
  nlohmann::json out;
  out["kind"] = config.kind;
  out["prefix"] = config.prefix.value_or("");
  out["hex_length"] = config.hex_length.value_or(0);
  out["deterministic"] = config.seed.has_value();
  out["ids"] = nlohmann::json::array();
  for (const auto& id : ids) {
    out["ids"].push_back(id);
  }
  return out.dump(2);
}

std::string render_ids_text(const std::vector<std::string>& ids) {
  std::ostringstream oss;
  for (const auto& id : ids) {
    oss << id << "\n";
  }
  return oss.str();
}

}  // namespace prefixid::apps
