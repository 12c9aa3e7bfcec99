#include "nuid/core/nuid.h"

#include <algorithm>

namespace nuid::core {

namespace {

// Largest multiple of 62 that fits in a byte; bytes at or above it are rejected.
constexpr unsigned kRejectionLimit = 248;

// A healthy source rejects a byte with probability 8/256; 64 consecutive rounds without
// an accepted byte means the source is stuck.
constexpr int kMaxRejectionRounds = 64;

}  // namespace

void draw_prefix(IEntropySource& entropy, const PrefixReduction reduction,
                 const std::span<char, kPrefixLength> out) {
  std::array<std::uint8_t, kPrefixLength> bytes{};

  if (reduction == PrefixReduction::kModulo) {
    entropy.fill(bytes);
    std::transform(bytes.begin(), bytes.end(), out.begin(),
                   [](const std::uint8_t b) { return kAlphabet[b % kBase]; });
    return;
  }

  std::size_t filled = 0;
  int empty_rounds = 0;
  while (filled < kPrefixLength) {
    const auto wanted = kPrefixLength - filled;
    entropy.fill(std::span<std::uint8_t>(bytes.data(), wanted));

    const auto before = filled;
    for (std::size_t i = 0; i < wanted; ++i) {
      if (bytes[i] < kRejectionLimit) {
        out[filled++] = kAlphabet[bytes[i] % kBase];
      }
    }

    if (filled != before) {
      empty_rounds = 0;
    } else if (++empty_rounds >= kMaxRejectionRounds) {
      throw EntropyUnavailable("entropy source produced only out-of-range bytes");
    }
  }
}

Nuid::Nuid() : Nuid(system_entropy()) {}

Nuid::Nuid(IEntropySource& entropy, const PrefixReduction reduction)
    : entropy_(&entropy), reduction_(reduction) {
  draw_prefix(*entropy_, reduction_, prefix_);
  reset_sequential();
}

Nuid::Nuid(Nuid&& other) noexcept
    : entropy_(other.entropy_),
      reduction_(other.reduction_),
      prefix_(other.prefix_),
      sequence_(other.sequence_),
      increment_(other.increment_) {
  other.sequence_ = kMaxSequence;
}

Nuid& Nuid::operator=(Nuid&& other) noexcept {
  if (this != &other) {
    entropy_ = other.entropy_;
    reduction_ = other.reduction_;
    prefix_ = other.prefix_;
    sequence_ = other.sequence_;
    increment_ = other.increment_;
    other.sequence_ = kMaxSequence;
  }
  return *this;
}

std::string Nuid::next() {
  std::string id(kTotalLength, kAlphabet[0]);
  next(std::span<char, kTotalLength>(id.data(), kTotalLength));
  return id;
}

void Nuid::next(const std::span<char, kTotalLength> out) {
  if (sequence_ + increment_ >= kMaxSequence) {
    rollover();
  }

  std::copy(prefix_.begin(), prefix_.end(), out.begin());
  encode_base62_fixed(sequence_, out.subspan<kPrefixLength>());
  sequence_ += increment_;
}

void Nuid::randomize_prefix() {
  draw_prefix(*entropy_, reduction_, prefix_);
}

Result<bool, StateError> Nuid::restore(const NuidState& state) {
  using R = Result<bool, StateError>;
  if (state.prefix.size() != kPrefixLength) {
    return R::err(StateError::kInvalidPrefixLength);
  }
  if (!std::all_of(state.prefix.begin(), state.prefix.end(),
                   [](const char ch) { return alphabet_index(ch).has_value(); })) {
    return R::err(StateError::kInvalidPrefixCharacter);
  }
  if (state.sequence >= kMaxSequence) {
    return R::err(StateError::kSequenceOutOfRange);
  }
  if (state.increment < kMinIncrement || state.increment >= kMaxIncrement) {
    return R::err(StateError::kIncrementOutOfRange);
  }

  std::copy(state.prefix.begin(), state.prefix.end(), prefix_.begin());
  sequence_ = state.sequence;
  increment_ = state.increment;
  return R::ok(true);
}

void Nuid::reset_sequential() {
  increment_ = kMinIncrement + pseudo_random_below(kMaxIncrement - kMinIncrement);
  // Starting below kMaxSequence - increment keeps the first advance in range.
  sequence_ = pseudo_random_below(kMaxSequence - increment_);
}

void Nuid::rollover() {
  // Draw into a scratch buffer so a failing source leaves the old state intact.
  std::array<char, kPrefixLength> fresh{};
  draw_prefix(*entropy_, reduction_, fresh);
  prefix_ = fresh;
  reset_sequential();
}

}  // namespace nuid::core
