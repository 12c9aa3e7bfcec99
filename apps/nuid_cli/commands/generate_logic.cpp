#include "generate_logic.h"

#include "nuid/core/entropy.h"
#include "nuid/core/global.h"

#include <charconv>
#include <exception>
#include <functional>
#include <iostream>
#include <thread>
#include <utility>

namespace nuid::cli {

namespace {

void join_all(std::vector<std::thread>& workers) {
  for (std::thread& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace

std::optional<GenerateMode> parse_generate_mode(const std::string_view value) {
  if (value == "private") {
    return GenerateMode::kPrivate;
  }
  if (value == "global") {
    return GenerateMode::kGlobal;
  }
  return std::nullopt;
}

std::string_view to_string(const GenerateMode mode) {
  switch (mode) {
    case GenerateMode::kPrivate:
      return "private";
    case GenerateMode::kGlobal:
      return "global";
  }
  return "private";
}

std::optional<core::PrefixReduction> parse_prefix_reduction(const std::string_view value) {
  if (value == "rejection") {
    return core::PrefixReduction::kRejection;
  }
  if (value == "modulo") {
    return core::PrefixReduction::kModulo;
  }
  return std::nullopt;
}

std::string_view to_string(const core::PrefixReduction reduction) {
  switch (reduction) {
    case core::PrefixReduction::kRejection:
      return "rejection";
    case core::PrefixReduction::kModulo:
      return "modulo";
  }
  return "rejection";
}

std::optional<std::size_t> parse_count(const std::string_view value, const std::size_t limit) {
  std::size_t parsed = 0;
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  if (parsed == 0 || parsed > limit) {
    return std::nullopt;
  }
  return parsed;
}

std::string validate_generate_config(const GenerateConfig& config) {
  if (config.count == 0 || config.count > kMaxCount) {
    return "Error: --count must be between 1 and " + std::to_string(kMaxCount);
  }
  if (config.threads == 0 || config.threads > kMaxThreads) {
    return "Error: --threads must be between 1 and " + std::to_string(kMaxThreads);
  }
  if (config.count > kMaxTotalIds / config.threads) {
    return "Error: --threads * --count must not exceed " + std::to_string(kMaxTotalIds);
  }
  // The process-wide generator is built with the default reduction.
  if (config.mode == GenerateMode::kGlobal && config.reduction_set) {
    return "Error: --reduction applies to --mode private only";
  }
  return "";
}

std::vector<std::string> generate_ids(const GenerateConfig& config) {
  return generate_ids(config,
                      [](std::function<void()> task) { return std::thread(std::move(task)); });
}

std::vector<std::string> generate_ids(const GenerateConfig& config,
                                      const WorkerLauncher& launch) {
  std::vector<std::vector<std::string>> per_thread(config.threads);
  std::vector<std::exception_ptr> failures(config.threads);

  std::vector<std::thread> workers;
  workers.reserve(config.threads);
  try {
    for (std::size_t t = 0; t < config.threads; ++t) {
      workers.push_back(launch([&config, &out = per_thread[t], &failure = failures[t]] {
        try {
          out.reserve(config.count);
          if (config.mode == GenerateMode::kGlobal) {
            for (std::size_t i = 0; i < config.count; ++i) {
              out.push_back(core::next());
            }
            return;
          }
          core::Nuid gen(core::system_entropy(), config.reduction);
          for (std::size_t i = 0; i < config.count; ++i) {
            out.push_back(gen.next());
          }
        } catch (...) {
          // Carried to the calling thread and rethrown after join.
          failure = std::current_exception();
        }
      }));
    }
  } catch (...) {
    // Running workers reference per_thread and failures; they must finish first.
    join_all(workers);
    throw;
  }

  join_all(workers);

  for (const auto& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  std::vector<std::string> ids;
  ids.reserve(config.threads * config.count);
  for (auto& chunk : per_thread) {
    for (auto& id : chunk) {
      ids.push_back(std::move(id));
    }
  }
  return ids;
}

nlohmann::json generate_report_json(const GenerateConfig& config,
                                    const std::vector<std::string>& ids) {
  nlohmann::json out;
  out["mode"] = std::string(to_string(config.mode));
  out["threads"] = config.threads;
  out["count"] = config.count;
  out["reduction"] = std::string(to_string(config.reduction));
  out["ids"] = ids;
  return out;
}

int execute_generate(const GenerateConfig& config) {
  const auto ids = generate_ids(config);

  if (config.json) {
    std::cout << generate_report_json(config, ids).dump(2) << "\n";
    return 0;
  }

  for (const auto& id : ids) {
    std::cout << id << "\n";
  }
  return 0;
}

}  // namespace nuid::cli
