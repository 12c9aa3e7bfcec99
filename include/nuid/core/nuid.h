#pragma once

#include "nuid/core/alphabet.h"
#include "nuid/core/entropy.h"
#include "nuid/core/result.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace nuid::core {

// The increment is re-drawn from [kMinIncrement, kMaxIncrement) on every rollover.
constexpr std::uint64_t kMinIncrement = 33;
constexpr std::uint64_t kMaxIncrement = 333;

// PrefixReduction selects how a random byte (0..255) is mapped onto the 62-symbol alphabet.
// kRejection: discard bytes >= 248 and draw again; every symbol equally likely (default)
// kModulo:    byte % 62 on exactly 12 bytes; symbols 0-7 are slightly more likely
enum class PrefixReduction {
  kRejection,  // NOLINT(readability-identifier-naming)
  kModulo,     // NOLINT(readability-identifier-naming)
};

// NuidState is a value snapshot of a generator, used for inspection and restore().
struct NuidState {
  std::string prefix;       // NOLINT(readability-identifier-naming)
  std::uint64_t sequence;   // NOLINT(readability-identifier-naming)
  std::uint64_t increment;  // NOLINT(readability-identifier-naming)
};

// Nuid produces 22-character base62 identifiers: a 12-character prefix drawn from a
// cryptographic source, followed by a 10-digit sequence that starts at a pseudo-random value
// and advances by a pseudo-random increment. Only prefix draws consume OS entropy.
//
// Invariants:
// - sequence < kMaxSequence after every emission (rollover happens before overflow)
// - prefix changes only on construction, randomize_prefix(), restore() or rollover
//
// Not thread-safe. Use one instance per thread, external locking, or LockedNuid.
class Nuid {
 public:
  // Draws prefix, sequence and increment. Throws EntropyUnavailable if the
  // cryptographic source fails.
  Nuid();

  // entropy must outlive this generator.
  explicit Nuid(IEntropySource& entropy,
                PrefixReduction reduction = PrefixReduction::kRejection);

  ~Nuid() = default;

  // Not copyable: a copy would emit the same identifiers as the original.
  Nuid(const Nuid&) = delete;
  Nuid& operator=(const Nuid&) = delete;

  // Movable. The moved-from generator is marked exhausted, so its next emission rolls over
  // to a fresh prefix instead of repeating the identifiers the target now owns.
  Nuid(Nuid&& other) noexcept;
  Nuid& operator=(Nuid&& other) noexcept;

  // Emit the next identifier. Rolls over to a fresh prefix/sequence/increment first when
  // sequence + increment would leave the representable range.
  [[nodiscard]] std::string next();

  // Allocation-free form of next(): writes exactly kTotalLength characters into out.
  void next(std::span<char, kTotalLength> out);

  // Replace the prefix only; sequence and increment continue unchanged.
  void randomize_prefix();

  // Replace the whole state after validation. On error the generator is left untouched.
  // A state with sequence + increment >= kMaxSequence is valid and rolls over on next().
  [[nodiscard]] Result<bool, StateError> restore(const NuidState& state);

  [[nodiscard]] std::string prefix() const {
    return std::string(prefix_.data(), prefix_.size());
  }
  [[nodiscard]] std::uint64_t sequence() const { return sequence_; }
  [[nodiscard]] std::uint64_t increment() const { return increment_; }
  [[nodiscard]] PrefixReduction reduction() const { return reduction_; }
  [[nodiscard]] NuidState state() const { return NuidState{prefix(), sequence_, increment_}; }

 private:
  void reset_sequential();
  void rollover();

  IEntropySource* entropy_;  // not owned
  PrefixReduction reduction_;
  std::array<char, kPrefixLength> prefix_{};
  std::uint64_t sequence_{0};
  std::uint64_t increment_{kMinIncrement};
};

// draw_prefix fills out with alphabet characters using bytes from entropy.
// Throws EntropyUnavailable when the source fails, or when under kRejection it keeps
// producing only rejected bytes.
void draw_prefix(IEntropySource& entropy, PrefixReduction reduction,
                 std::span<char, kPrefixLength> out);

}  // namespace nuid::core
