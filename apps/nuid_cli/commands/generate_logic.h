#pragma once

#include "nuid/core/nuid.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace nuid::cli {

// GenerateMode selects which entry point the generate command exercises.
// kPrivate: each worker thread owns an unsynchronized Nuid
// kGlobal:  all worker threads share the process-wide locked generator
enum class GenerateMode {
  kPrivate,  // NOLINT(readability-identifier-naming)
  kGlobal,   // NOLINT(readability-identifier-naming)
};

constexpr std::size_t kMaxCount = 1'000'000;
constexpr std::size_t kMaxThreads = 256;
// Upper bound on threads * count; every identifier is held in memory before printing.
constexpr std::size_t kMaxTotalIds = 1'000'000;

// GenerateConfig holds all parsed flags for `nuid_cli generate`.
// Every field has an explicit default.
struct GenerateConfig {
  std::size_t count{1};                                                // NOLINT(readability-identifier-naming)
  std::size_t threads{1};                                              // NOLINT(readability-identifier-naming)
  GenerateMode mode{GenerateMode::kPrivate};                           // NOLINT(readability-identifier-naming)
  core::PrefixReduction reduction{core::PrefixReduction::kRejection};  // NOLINT(readability-identifier-naming)
  bool reduction_set{false};                                           // NOLINT(readability-identifier-naming)
  bool json{false};                                                    // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::optional<GenerateMode> parse_generate_mode(std::string_view value);
[[nodiscard]] std::string_view to_string(GenerateMode mode);

[[nodiscard]] std::optional<core::PrefixReduction> parse_prefix_reduction(std::string_view value);
[[nodiscard]] std::string_view to_string(core::PrefixReduction reduction);

// parse_count parses a decimal count in [1, limit]; anything else is nullopt.
[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view value, std::size_t limit);

// validate_generate_config returns an empty string for a usable config, otherwise the
// message to print.
[[nodiscard]] std::string validate_generate_config(const GenerateConfig& config);

// WorkerLauncher starts one worker thread running the given task.
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

// generate_ids runs config.threads workers, each emitting config.count identifiers, and
// returns them thread-major (all of worker 0, then worker 1, ...).
// Throws core::EntropyUnavailable if any worker's generator cannot draw entropy.
// If a worker cannot be started, the workers already running are joined and the launch
// error is rethrown.
[[nodiscard]] std::vector<std::string> generate_ids(const GenerateConfig& config);
[[nodiscard]] std::vector<std::string> generate_ids(const GenerateConfig& config,
                                                    const WorkerLauncher& launch);

// generate_report_json builds {"mode","threads","count","reduction","ids":[...]}.
[[nodiscard]] nlohmann::json generate_report_json(const GenerateConfig& config,
                                                  const std::vector<std::string>& ids);

// execute_generate: generate and print identifiers, one per line or as JSON.
int execute_generate(const GenerateConfig& config);

}  // namespace nuid::cli
