#include "inspect.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<nuid::apps::Option<nuid::cli::InspectConfig>> options;
  const auto parsed = nuid::apps::parse_options(argc, argv, options, 2);

  for (const auto& error : parsed.errors) {
    std::cerr << error << "\n";
  }

  nuid::cli::InspectConfig config = parsed.config;
  config.ids = parsed.positional;

  const auto problem = nuid::cli::validate_inspect_config(config);
  if (!parsed.ok() || !problem.empty()) {
    if (!problem.empty()) {
      std::cerr << problem << "\n";
    }
    std::cerr << "Usage: nuid_cli inspect <id> [<id>...]\n";
    return 1;
  }

  return nuid::cli::execute_inspect(config);
}
