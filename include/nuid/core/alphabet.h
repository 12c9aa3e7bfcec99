#pragma once

#include "nuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace nuid::core {

// Base62 digit-to-character mapping. Index 0 ('0') is the padding character.
constexpr std::string_view kAlphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr std::uint64_t kBase = 62;
static_assert(kAlphabet.size() == kBase);

// Identifier layout: 12 prefix characters followed by a 10-digit base62 sequence.
constexpr std::size_t kPrefixLength = 12;
constexpr std::size_t kSequenceLength = 10;
constexpr std::size_t kTotalLength = kPrefixLength + kSequenceLength;

// 62^10: the number of values representable in the sequence field.
constexpr std::uint64_t kMaxSequence = 839'299'365'868'340'224ull;

// alphabet_index returns the digit value of ch, or nullopt if ch is not a base62 character.
[[nodiscard]] constexpr std::optional<std::size_t> alphabet_index(const char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return static_cast<std::size_t>(ch - '0');
  }
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<std::size_t>(ch - 'A') + 10;
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<std::size_t>(ch - 'a') + 36;
  }
  return std::nullopt;
}

// encode_base62_fixed writes value into out as out.size() digits, most significant first,
// left-padded with kAlphabet[0]. Digits above out.size() are dropped.
void encode_base62_fixed(std::uint64_t value, std::span<char> out) noexcept;

// encode_sequence returns the 10-character sequence field for value (value < kMaxSequence).
[[nodiscard]] std::string encode_sequence(std::uint64_t value);

// decode_base62 parses a most-significant-first base62 string.
[[nodiscard]] Result<std::uint64_t, DecodeError> decode_base62(std::string_view digits);

// NuidParts is the decoded view of a 22-character identifier.
struct NuidParts {
  std::string prefix;      // NOLINT(readability-identifier-naming)
  std::uint64_t sequence;  // NOLINT(readability-identifier-naming)
};

// is_valid_nuid: exactly kTotalLength characters, all from kAlphabet.
[[nodiscard]] bool is_valid_nuid(std::string_view id) noexcept;

// split_nuid separates an identifier into its prefix and decoded sequence.
// Fails with kInvalidLength unless id is exactly kTotalLength characters.
[[nodiscard]] Result<NuidParts, DecodeError> split_nuid(std::string_view id);

}  // namespace nuid::core
