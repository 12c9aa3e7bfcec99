#include "nuid/core/global.h"

#include <memory>

namespace nuid::core {

std::string LockedNuid::next() {
  std::lock_guard<std::mutex> lock(mutex_);
  return nuid_.next();
}

void LockedNuid::randomize_prefix() {
  std::lock_guard<std::mutex> lock(mutex_);
  nuid_.randomize_prefix();
}

NuidState LockedNuid::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nuid_.state();
}

namespace {

std::once_flag g_init_flag;
std::unique_ptr<LockedNuid> g_instance;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

}  // namespace

LockedNuid& global() {
  // call_once leaves the flag unset when construction throws.
  std::call_once(g_init_flag, [] { g_instance = std::make_unique<LockedNuid>(); });
  return *g_instance;
}

std::string next() {
  return global().next();
}

void randomize_global_prefix() {
  global().randomize_prefix();
}

}  // namespace nuid::core
