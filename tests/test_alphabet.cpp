#include "nuid/core/alphabet.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <string>

using namespace nuid::core;

TEST_CASE("Alphabet: 62 symbols ordered digits, upper, lower", "[alphabet]") {
  REQUIRE(kAlphabet.size() == kBase);
  CHECK(kAlphabet.front() == '0');
  CHECK(kAlphabet[10] == 'A');
  CHECK(kAlphabet[36] == 'a');
  CHECK(kAlphabet.back() == 'z');
  CHECK(kTotalLength == 22);
}

TEST_CASE("alphabet_index: inverse of kAlphabet", "[alphabet]") {
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    const auto index = alphabet_index(kAlphabet[i]);
    REQUIRE(index.has_value());
    CHECK(index.value() == i);
  }
}

TEST_CASE("alphabet_index: rejects non-base62 characters", "[alphabet]") {
  CHECK_FALSE(alphabet_index('-').has_value());
  CHECK_FALSE(alphabet_index('_').has_value());
  CHECK_FALSE(alphabet_index(' ').has_value());
  CHECK_FALSE(alphabet_index('\0').has_value());
  CHECK_FALSE(alphabet_index('/').has_value());
  CHECK_FALSE(alphabet_index('{').has_value());
}

TEST_CASE("kMaxSequence equals 62^10", "[alphabet]") {
  std::uint64_t expected = 1;
  for (std::size_t i = 0; i < kSequenceLength; ++i) {
    expected *= kBase;
  }
  CHECK(kMaxSequence == expected);
}

// ── encoding ────────────────────────────────────────────────────────────────

TEST_CASE("encode_sequence: fixed width, zero padded", "[alphabet]") {
  CHECK(encode_sequence(0) == "0000000000");
  CHECK(encode_sequence(33) == "000000000X");
  CHECK(encode_sequence(61) == "000000000z");
  CHECK(encode_sequence(62) == "0000000010");
  CHECK(encode_sequence(kMaxSequence - 1) == "zzzzzzzzzz");
}

TEST_CASE("encode_base62_fixed: writes exactly the span width", "[alphabet]") {
  std::string buf = "######";
  encode_base62_fixed(3843, std::span<char>(buf.data() + 1, 4));  // 3843 = 62^2 - 1
  CHECK(buf == "#00zz#");
}

// ── decoding ────────────────────────────────────────────────────────────────

TEST_CASE("decode_base62: inverts encode_sequence", "[alphabet]") {
  const std::array<std::uint64_t, 6> values = {0, 1, 33, 62, 123456789, kMaxSequence - 1};
  for (const auto value : values) {
    const auto decoded = decode_base62(encode_sequence(value));
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == value);
  }
}

TEST_CASE("decode_base62: error cases", "[alphabet]") {
  SECTION("empty input") {
    const auto r = decode_base62("");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == DecodeError::kEmpty);
  }

  SECTION("invalid character") {
    const auto r = decode_base62("00-1");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == DecodeError::kInvalidCharacter);
  }

  SECTION("overflow past 64 bits") {
    // 62^11 > 2^64, so eleven 'z' digits cannot fit.
    const auto r = decode_base62("zzzzzzzzzzz");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == DecodeError::kOverflow);
  }
}

// ── identifier parsing ──────────────────────────────────────────────────────

TEST_CASE("is_valid_nuid: length and alphabet checks", "[alphabet]") {
  CHECK(is_valid_nuid("ABCDEFGHIJKL0000000000"));
  CHECK_FALSE(is_valid_nuid("ABCDEFGHIJKL000000000"));
  CHECK_FALSE(is_valid_nuid("ABCDEFGHIJKL00000000000"));
  CHECK_FALSE(is_valid_nuid("ABCDEFGHIJK-0000000000"));
  CHECK_FALSE(is_valid_nuid(""));
}

TEST_CASE("split_nuid: prefix and decoded sequence", "[alphabet]") {
  const auto parts = split_nuid("ABCDEFGHIJKL000000000X");
  REQUIRE(parts.has_value());
  CHECK(parts.value().prefix == "ABCDEFGHIJKL");
  CHECK(parts.value().sequence == 33);
}

TEST_CASE("split_nuid: rejects malformed identifiers", "[alphabet]") {
  CHECK(split_nuid("").error() == DecodeError::kEmpty);
  CHECK(split_nuid("short").error() == DecodeError::kInvalidLength);
  CHECK(split_nuid("ABCDEFGHIJK!0000000000").error() == DecodeError::kInvalidCharacter);
  CHECK(split_nuid("ABCDEFGHIJKL00000000.0").error() == DecodeError::kInvalidCharacter);
}

TEST_CASE("to_string: every error has a message", "[alphabet]") {
  CHECK_FALSE(to_string(DecodeError::kEmpty).empty());
  CHECK_FALSE(to_string(DecodeError::kInvalidCharacter).empty());
  CHECK_FALSE(to_string(DecodeError::kInvalidLength).empty());
  CHECK_FALSE(to_string(DecodeError::kOverflow).empty());
}
