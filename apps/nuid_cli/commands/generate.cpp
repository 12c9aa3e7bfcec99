#include "generate.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

using nuid::cli::GenerateConfig;

namespace {

std::vector<nuid::apps::Option<GenerateConfig>> build_option_registry() {
  return {
      {"--count", true, "Identifiers per worker thread (1-1000000, default 1)",
       [](GenerateConfig& c, const std::string& v) {
         const auto parsed = nuid::cli::parse_count(v, nuid::cli::kMaxCount);
         if (!parsed.has_value()) {
           return false;
         }
         c.count = parsed.value();
         return true;
       }},
      {"--threads", true, "Worker threads (1-256, default 1)",
       [](GenerateConfig& c, const std::string& v) {
         const auto parsed = nuid::cli::parse_count(v, nuid::cli::kMaxThreads);
         if (!parsed.has_value()) {
           return false;
         }
         c.threads = parsed.value();
         return true;
       }},
      {"--mode", true, "Generator entry point (private|global, default private)",
       [](GenerateConfig& c, const std::string& v) {
         const auto parsed = nuid::cli::parse_generate_mode(v);
         if (!parsed.has_value()) {
           return false;
         }
         c.mode = parsed.value();
         return true;
       }},
      {"--reduction", true, "Prefix byte mapping (rejection|modulo, default rejection)",
       [](GenerateConfig& c, const std::string& v) {
         const auto parsed = nuid::cli::parse_prefix_reduction(v);
         if (!parsed.has_value()) {
           return false;
         }
         c.reduction = parsed.value();
         c.reduction_set = true;
         return true;
       }},
      {"--json", false, "Print a JSON report instead of one identifier per line",
       [](GenerateConfig& c, const std::string& /*v*/) {
         c.json = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  const auto parsed = nuid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.ok() || !parsed.positional.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    for (const auto& extra : parsed.positional) {
      std::cerr << "Unexpected argument: " << extra << "\n";
    }
    std::cerr << "Usage: nuid_cli generate [options]\n" << nuid::apps::format_options(options);
    return 1;
  }

  const auto error = nuid::cli::validate_generate_config(parsed.config);
  if (!error.empty()) {
    std::cerr << error << "\n";
    return 1;
  }

  return nuid::cli::execute_generate(parsed.config);
}
