#pragma once

#include "nuid/core/nuid.h"

#include <mutex>
#include <string>
#include <utility>

namespace nuid::core {

// LockedNuid is the synchronized entry point over Nuid: every operation, including the
// rollover check-and-mutate inside next(), runs under one mutex. Raw Nuid is the
// unsynchronized entry point for callers that own their concurrency.
// No fairness between waiting callers is promised.
class LockedNuid {
 public:
  LockedNuid() = default;
  explicit LockedNuid(Nuid&& nuid) : nuid_(std::move(nuid)) {}
  ~LockedNuid() = default;

  // Not copyable or movable (contains a mutex)
  LockedNuid(const LockedNuid&) = delete;
  LockedNuid& operator=(const LockedNuid&) = delete;
  LockedNuid(LockedNuid&&) = delete;
  LockedNuid& operator=(LockedNuid&&) = delete;

  [[nodiscard]] std::string next();
  void randomize_prefix();
  [[nodiscard]] NuidState state() const;

 private:
  mutable std::mutex mutex_;
  Nuid nuid_;
};

// global returns the process-wide generator, constructed on first use.
// Throws EntropyUnavailable if construction fails; a later call retries construction.
LockedNuid& global();

// next returns an identifier from the process-wide generator. Thread-safe.
[[nodiscard]] std::string next();

// randomize_global_prefix forces a namespace change on the process-wide generator.
void randomize_global_prefix();

}  // namespace nuid::core
