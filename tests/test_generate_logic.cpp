#include <catch2/catch_test_macros.hpp>

#include "commands/generate_logic.h"
#include "nuid/core/alphabet.h"

#include <atomic>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

using namespace nuid::cli;
using nuid::core::PrefixReduction;

// ── flag value parsing ──────────────────────────────────────────────────────

TEST_CASE("parse_count: decimal values within [1, limit]", "[cli][generate]") {
  CHECK(parse_count("1", 10) == std::optional<std::size_t>{1});
  CHECK(parse_count("10", 10) == std::optional<std::size_t>{10});
  CHECK_FALSE(parse_count("0", 10).has_value());
  CHECK_FALSE(parse_count("11", 10).has_value());
  CHECK_FALSE(parse_count("", 10).has_value());
  CHECK_FALSE(parse_count("-3", 10).has_value());
  CHECK_FALSE(parse_count("5x", 10).has_value());
  CHECK_FALSE(parse_count("99999999999999999999999", kMaxCount).has_value());
}

TEST_CASE("parse_generate_mode and parse_prefix_reduction", "[cli][generate]") {
  CHECK(parse_generate_mode("private") == GenerateMode::kPrivate);
  CHECK(parse_generate_mode("global") == GenerateMode::kGlobal);
  CHECK_FALSE(parse_generate_mode("shared").has_value());

  CHECK(parse_prefix_reduction("rejection") == PrefixReduction::kRejection);
  CHECK(parse_prefix_reduction("modulo") == PrefixReduction::kModulo);
  CHECK_FALSE(parse_prefix_reduction("mod").has_value());

  CHECK(to_string(GenerateMode::kGlobal) == "global");
  CHECK(to_string(PrefixReduction::kModulo) == "modulo");
}

// ── validation ──────────────────────────────────────────────────────────────

TEST_CASE("validate_generate_config: defaults are valid", "[cli][generate]") {
  CHECK(validate_generate_config(GenerateConfig{}).empty());
}

TEST_CASE("validate_generate_config: largest accepted total", "[cli][generate]") {
  GenerateConfig config;
  config.threads = 4;
  config.count = kMaxTotalIds / 4;
  CHECK(validate_generate_config(config).empty());
}

TEST_CASE("validate_generate_config: out-of-range values", "[cli][generate]") {
  GenerateConfig config;

  SECTION("zero count") {
    config.count = 0;
    CHECK_FALSE(validate_generate_config(config).empty());
  }

  SECTION("too many threads") {
    config.threads = kMaxThreads + 1;
    CHECK_FALSE(validate_generate_config(config).empty());
  }

  SECTION("count above the per-thread limit") {
    config.count = kMaxCount + 1;
    CHECK_FALSE(validate_generate_config(config).empty());
  }

  SECTION("threads times count above the total limit") {
    config.threads = 4;
    config.count = kMaxTotalIds / 4 + 1;
    CHECK_FALSE(validate_generate_config(config).empty());
  }

  SECTION("reduction with the global generator") {
    config.mode = GenerateMode::kGlobal;
    config.reduction = PrefixReduction::kModulo;
    config.reduction_set = true;
    CHECK_FALSE(validate_generate_config(config).empty());
  }
}

// ── generation ──────────────────────────────────────────────────────────────

TEST_CASE("generate_ids: private mode, one generator per thread", "[cli][generate]") {
  GenerateConfig config;
  config.count = 2'000;
  config.threads = 4;
  config.reduction = PrefixReduction::kModulo;

  const auto ids = generate_ids(config);
  REQUIRE(ids.size() == 8'000);

  const std::unordered_set<std::string> unique(ids.begin(), ids.end());
  CHECK(unique.size() == ids.size());

  // Thread-major order: each block of `count` ids comes from one generator.
  for (std::size_t t = 0; t < config.threads; ++t) {
    const auto prefix = ids[t * config.count].substr(0, nuid::core::kPrefixLength);
    for (std::size_t i = 0; i < config.count; ++i) {
      const auto& id = ids[t * config.count + i];
      REQUIRE(nuid::core::is_valid_nuid(id));
      // A rollover inside 2'000 calls would need a start within 666'000 of 62^10.
      REQUIRE(id.substr(0, nuid::core::kPrefixLength) == prefix);
    }
  }
}

TEST_CASE("generate_ids: global mode shares one generator", "[cli][generate]") {
  GenerateConfig config;
  config.count = 1'000;
  config.threads = 3;
  config.mode = GenerateMode::kGlobal;

  const auto ids = generate_ids(config);
  REQUIRE(ids.size() == 3'000);
  const std::unordered_set<std::string> unique(ids.begin(), ids.end());
  CHECK(unique.size() == ids.size());
}

TEST_CASE("generate_ids: a failed worker launch joins started workers and rethrows",
          "[cli][generate]") {
  GenerateConfig config;
  config.count = 100;
  config.threads = 4;

  std::size_t launched = 0;
  std::atomic<std::size_t> finished{0};
  const WorkerLauncher launch = [&launched, &finished](std::function<void()> task) {
    if (launched == 2) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                              "thread limit reached");
    }
    ++launched;
    return std::thread([task = std::move(task), &finished] {
      task();
      ++finished;
    });
  };

  CHECK_THROWS_AS(generate_ids(config, launch), std::system_error);
  // Both started workers ran to completion before the error reached the caller.
  CHECK(launched == 2);
  CHECK(finished.load() == 2);
}

TEST_CASE("generate_ids: an injected launcher runs every worker",
          "[cli][generate]") {
  GenerateConfig config;
  config.count = 50;
  config.threads = 2;

  const auto ids = generate_ids(
      config, [](std::function<void()> task) { return std::thread(std::move(task)); });
  REQUIRE(ids.size() == 100);
  for (const auto& id : ids) {
    CHECK(nuid::core::is_valid_nuid(id));
  }
}

TEST_CASE("generate_report_json: reports settings and ids", "[cli][generate]") {
  GenerateConfig config;
  config.count = 2;
  const std::vector<std::string> ids = {"ABCDEFGHIJKL0000000000", "ABCDEFGHIJKL000000000X"};

  const auto json = generate_report_json(config, ids);
  CHECK(json["mode"] == "private");
  CHECK(json["threads"] == 1);
  CHECK(json["count"] == 2);
  CHECK(json["reduction"] == "rejection");
  REQUIRE(json["ids"].size() == 2);
  CHECK(json["ids"][1] == "ABCDEFGHIJKL000000000X");
}
