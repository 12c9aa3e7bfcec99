#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nuid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is rejected; a rejected
// value is recorded in ParsedArgs::errors and parsing continues.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options: the populated config, the non-flag tokens
// in encounter order, and one message per problem found.
template <typename Config>
struct ParsedArgs {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;      // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Unknown flags, missing values and rejected values become errors.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, const char* const argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (arg.size() > 1 && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.positional.push_back(arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      opt->handler(parsed.config, "");
      continue;
    }
    if (i + 1 >= argc) {
      parsed.errors.push_back("Option " + arg + " requires a value");
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid " + arg + ": " + value);
    }
  }

  return parsed;
}

// format_options renders one "  <name> <description>" line per option for usage text.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream oss;
  for (const auto& opt : options) {
    oss << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
  return oss.str();
}

}  // namespace nuid::apps
