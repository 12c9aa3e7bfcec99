#include "nuid/core/entropy.h"
#include "nuid/core/version.h"

#include "commands/generate.h"
#include "commands/inspect.h"
#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: nuid_cli <command> [options]\n"
            << "Commands:\n"
            << "  generate   Generate identifiers\n"
            << "  inspect    Decode identifiers into prefix and sequence\n"
            << "  --version  Print the version and exit\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--version") {
    std::cout << "nuid " << nuid::core::kBuildVersion << "\n";
    return 0;
  }

  try {
    if (subcommand == "generate") {
      return cmd_generate(argc, argv);
    }
    if (subcommand == "inspect") {
      return cmd_inspect(argc, argv);
    }
  } catch (const nuid::core::EntropyUnavailable& e) {
    // Broken host environment: report and stop, never retry.
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
