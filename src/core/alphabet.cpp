#include "nuid/core/alphabet.h"

#include <limits>

namespace nuid::core {

void encode_base62_fixed(std::uint64_t value, const std::span<char> out) noexcept {
  for (auto it = out.rbegin(); it != out.rend(); ++it) {
    *it = kAlphabet[static_cast<std::size_t>(value % kBase)];
    value /= kBase;
  }
}

std::string encode_sequence(const std::uint64_t value) {
  std::string out(kSequenceLength, kAlphabet[0]);
  encode_base62_fixed(value, out);
  return out;
}

Result<std::uint64_t, DecodeError> decode_base62(const std::string_view digits) {
  using R = Result<std::uint64_t, DecodeError>;
  if (digits.empty()) {
    return R::err(DecodeError::kEmpty);
  }

  constexpr std::uint64_t kLimit = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for (const char ch : digits) {
    const auto digit = alphabet_index(ch);
    if (!digit.has_value()) {
      return R::err(DecodeError::kInvalidCharacter);
    }
    // value * 62 + digit must not wrap.
    if (value > (kLimit - digit.value()) / kBase) {
      return R::err(DecodeError::kOverflow);
    }
    value = value * kBase + digit.value();
  }
  return R::ok(value);
}

bool is_valid_nuid(const std::string_view id) noexcept {
  if (id.size() != kTotalLength) {
    return false;
  }
  for (const char ch : id) {
    if (!alphabet_index(ch).has_value()) {
      return false;
    }
  }
  return true;
}

Result<NuidParts, DecodeError> split_nuid(const std::string_view id) {
  using R = Result<NuidParts, DecodeError>;
  if (id.empty()) {
    return R::err(DecodeError::kEmpty);
  }
  if (id.size() != kTotalLength) {
    return R::err(DecodeError::kInvalidLength);
  }

  const auto prefix = id.substr(0, kPrefixLength);
  for (const char ch : prefix) {
    if (!alphabet_index(ch).has_value()) {
      return R::err(DecodeError::kInvalidCharacter);
    }
  }

  // Ten base62 digits never exceed 62^10 - 1, so overflow cannot occur here.
  const auto sequence = decode_base62(id.substr(kPrefixLength));
  if (!sequence.has_value()) {
    return R::err(sequence.error());
  }
  return R::ok(NuidParts{std::string(prefix), sequence.value()});
}

}  // namespace nuid::core
