#include "commands/generate.h"

#include "prefixid/core/version.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  const std::string first = argv[1];
  if (first == "--version") {
    std::cout << "prefixid " << prefixid::core::kBuildVersion << "\n";
    return 0;
  }
  if (first == "--help" || first == "-h") {
    print_usage(argv[0]);
    return 0;
  }

  return cmd_generate(argc, argv);
}
