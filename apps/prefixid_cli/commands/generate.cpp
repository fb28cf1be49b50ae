#include "generate.h"

#include "generate_logic.h"

#include "prefixid/core/prefixed_id.h"
#include "prefixid/core/uuid_source.h"

#include <iostream>
#include <memory>
#include <string>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = prefixid::apps::parse_generate_args(argc, argv);
  if (!config.valid) {
    print_usage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return 1;
  }

  // A seed selects the reproducible source; otherwise draw random UUIDs.
  std::unique_ptr<prefixid::core::DeterministicUuidSource> seeded;
  prefixid::core::IUuidSource* source = &prefixid::core::system_uuid_source();
  if (config.seed.has_value()) {
    seeded = std::make_unique<prefixid::core::DeterministicUuidSource>(config.seed.value());
    source = seeded.get();
  }

  const auto result = prefixid::apps::generate_ids(*source, config.prefix.value(),
                                                   config.hex_length.value(), config.count);
  if (!result.has_value()) {
    std::cerr << "Error: " << prefixid::core::id_error_to_string(result.error()) << "\n";
    return 1;
  }

  if (config.json) {
    std::cout << prefixid::apps::render_ids_json(config, result.value()) << "\n";
  } else {
    std::cout << prefixid::apps::render_ids_text(result.value());
  }
  return 0;
}

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <kind> [options]\n"
            << "       " << program << " custom --prefix <p> --length <n> [options]\n"
            << "       " << program << " --version\n\n"
            << "Kinds: character (char_, 12), user (user_, 16), story (story_, 12),\n"
            << "       segment (seg_, 10), session (sess_, 16), custom\n\n"
            << "Options:\n";
  prefixid::apps::print_options(std::cerr, prefixid::apps::generate_options());
}
