#include "flakeid/core/version.h"

#include "commands/decode.h"
#include "commands/next.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "flakeid_cli v" << flakeid::core::kBuildVersion << "\n"
            << "Usage:\n"
               "  flakeid_cli next [--data-center N] [--worker N] [--epoch <time>] "
               "[--count N] [--json]\n"
               "  flakeid_cli decode <id> [--epoch <time>]\n"
               "  flakeid_cli --version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "next") {
    return cmd_next(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << flakeid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
