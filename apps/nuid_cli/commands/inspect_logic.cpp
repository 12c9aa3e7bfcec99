#include "inspect_logic.h"

#include "nuid/core/alphabet.h"

#include <iostream>
#include <utility>

namespace nuid::cli {

nlohmann::json inspect_id(const std::string_view id) {
  nlohmann::json out;
  out["id"] = std::string(id);

  const auto parts = core::split_nuid(id);
  if (!parts.has_value()) {
    out["valid"] = false;
    out["error"] = std::string(core::to_string(parts.error()));
    return out;
  }

  out["valid"] = true;
  out["prefix"] = parts.value().prefix;
  out["sequence"] = parts.value().sequence;
  return out;
}

std::string validate_inspect_config(const InspectConfig& config) {
  if (config.ids.empty()) {
    return "Error: inspect needs at least one id";
  }
  return "";
}

int execute_inspect(const InspectConfig& config) {
  nlohmann::json out = nlohmann::json::array();
  bool all_valid = true;
  for (const auto& id : config.ids) {
    auto entry = inspect_id(id);
    all_valid = all_valid && entry["valid"].get<bool>();
    out.push_back(std::move(entry));
  }

  std::cout << out.dump(2) << "\n";
  return all_valid ? 0 : 1;
}

}  // namespace nuid::cli
