#include <catch2/catch_test_macros.hpp>
#include "chatrelay/utils.hpp"

using namespace chatrelay;

TEST_CASE("Utf8 - ASCII and valid multibyte pass through", "[utils]") {
  REQUIRE(Utf8::decode_lossy("hi") == "hi");
  REQUIRE(Utf8::decode_lossy("") == "");
  // "こんにちは" and the euro sign
  std::string jp = "\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF";
  REQUIRE(Utf8::decode_lossy(jp) == jp);
  REQUIRE(Utf8::decode_lossy("\xE2\x82\xAC") == "\xE2\x82\xAC");
  // 4-byte sequence (U+1F600)
  REQUIRE(Utf8::decode_lossy("\xF0\x9F\x98\x80") == "\xF0\x9F\x98\x80");
}

TEST_CASE("Utf8 - invalid bytes are replaced", "[utils]") {
  REQUIRE(Utf8::decode_lossy("\xFF") == "\xEF\xBF\xBD");
  REQUIRE(Utf8::decode_lossy("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
  // Lone continuation byte
  REQUIRE(Utf8::decode_lossy("\x80") == "\xEF\xBF\xBD");
  // Overlong encoding of '/'
  REQUIRE(Utf8::decode_lossy("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("Utf8 - truncated sequence yields one replacement", "[utils]") {
  // Chunk cut in the middle of a 3-byte character
  REQUIRE(Utf8::decode_lossy("ab\xE3\x81") == "ab\xEF\xBF\xBD");
  REQUIRE(Utf8::decode_lossy("\xE2\x82" "x") == "\xEF\xBF\xBD" "x");
}

TEST_CASE("Utf8 - surrogates are rejected", "[utils]") {
  REQUIRE(Utf8::decode_lossy("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("Utf8 - well-formed input is unchanged", "[utils]") {
  REQUIRE(Utf8::decode_lossy("\xE2\x82\xAC \xF0\x9F\x98\x80") == "\xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST_CASE("parse_unsigned - accepts values in range", "[utils]") {
  auto port = parse_unsigned("7000", 65535);
  REQUIRE(port.has_value());
  REQUIRE(port.value() == 7000);
  REQUIRE(parse_unsigned("0", 65535).value() == 0);
  REQUIRE(parse_unsigned("65535", 65535).value() == 65535);
}

TEST_CASE("parse_unsigned - rejects out of range and malformed text", "[utils]") {
  REQUIRE_FALSE(parse_unsigned("70000", 65535).has_value());
  REQUIRE_FALSE(parse_unsigned("65536", 65535).has_value());
  REQUIRE_FALSE(parse_unsigned("-1", 65535).has_value());
  REQUIRE_FALSE(parse_unsigned("80x", 65535).has_value());
  REQUIRE_FALSE(parse_unsigned("", 65535).has_value());
  REQUIRE_FALSE(parse_unsigned("99999999999999999999999", UINT64_MAX).has_value());
  REQUIRE(parse_unsigned("12a", 100).get_error() == ErrorCode::kInvalidArgument);
}

TEST_CASE("starts_with - prefix semantics", "[utils]") {
  REQUIRE(starts_with(":end", ":end"));
  REQUIRE(starts_with(":ending", ":end"));
  REQUIRE(starts_with(":end\r\n", ":end"));
  REQUIRE_FALSE(starts_with(" :end", ":end"));
  REQUIRE_FALSE(starts_with(":END", ":end"));
  REQUIRE_FALSE(starts_with(":en", ":end"));
  REQUIRE(starts_with("anything", ""));
}

TEST_CASE("format_ipv4 - dotted quad", "[utils]") {
  REQUIRE(format_ipv4(0x7F000001) == "127.0.0.1");
  REQUIRE(format_ipv4(0xC0A8010A) == "192.168.1.10");
  REQUIRE(format_ipv4(0) == "0.0.0.0");
  REQUIRE(format_ipv4(0xFFFFFFFF) == "255.255.255.255");
}
