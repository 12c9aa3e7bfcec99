#include "nuid/core/entropy.h"

#include <exception>
#include <utility>

namespace nuid::core {

void SystemEntropySource::fill(std::span<std::uint8_t> out) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    if (!device_) {
      device_ = std::make_unique<std::random_device>();
    }
    // random_device yields 32 bits per call; spread each draw over four bytes.
    std::size_t i = 0;
    while (i < out.size()) {
      auto word = (*device_)();
      for (int b = 0; b < 4 && i < out.size(); ++b, ++i) {
        out[i] = static_cast<std::uint8_t>(word & 0xFFu);
        word >>= 8u;
      }
    }
  } catch (const std::exception& e) {
    throw EntropyUnavailable("cryptographic random source unavailable: " + std::string(e.what()));
  }
}

FixedEntropySource::FixedEntropySource(std::vector<std::uint8_t> pattern)
    : pattern_(std::move(pattern)) {}

void FixedEntropySource::fill(std::span<std::uint8_t> out) {
  if (pattern_.empty()) {
    throw EntropyUnavailable("FixedEntropySource: empty byte pattern");
  }
  for (auto& byte : out) {
    byte = pattern_[drawn_ % pattern_.size()];
    ++drawn_;
  }
}

IEntropySource& system_entropy() {
  static SystemEntropySource source;
  return source;
}

std::uint64_t pseudo_random_below(const std::uint64_t bound) {
  // Seeding reads the OS entropy provider once per thread, not per draw.
  static thread_local std::mt19937_64 engine = [] {
    try {
      std::random_device rd;
      std::seed_seq seq{rd(), rd(), rd(), rd()};
      return std::mt19937_64(seq);
    } catch (const std::exception& e) {
      throw EntropyUnavailable("cannot seed sequence generator: " + std::string(e.what()));
    }
  }();
  std::uniform_int_distribution<std::uint64_t> dist(0, bound - 1);
  return dist(engine);
}

}  // namespace nuid::core
