#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace nuid::cli {

// InspectConfig holds the parsed arguments of `nuid_cli inspect`.
struct InspectConfig {
  std::vector<std::string> ids;  // NOLINT(readability-identifier-naming)
};

// validate_inspect_config returns an empty string for a usable config, otherwise the
// message to print.
[[nodiscard]] std::string validate_inspect_config(const InspectConfig& config);

// inspect_id decodes one identifier.
// Valid:   {"id", "valid": true, "prefix", "sequence"}
// Invalid: {"id", "valid": false, "error"}
[[nodiscard]] nlohmann::json inspect_id(std::string_view id);

// execute_inspect prints a JSON array with one inspect_id() entry per id.
// Returns 0 when every id is valid, 1 otherwise.
int execute_inspect(const InspectConfig& config);

}  // namespace nuid::cli
