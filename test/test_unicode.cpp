#include "private/unicode.hpp"
#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include "regexp_test_common.hpp"
#include "testing.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

using namespace std::literals;

namespace {
auto encoding_error_offset(auto &&fn) -> long {
  try {
    fn();
  } catch (regexp::EncodingError const &error) {
    return static_cast<long>(error.offset());
  }
  return -1;
}
} // namespace

TEST_CASE(decode_utf8, "[regexp][unicode]") {
  size_t size = 0;
  CHECK(regexp::decode_utf8_char("a", size) == regexp::Codepoint{'a'});
  CHECK(size == 1);
  CHECK(regexp::decode_utf8_char("\xc4\x80", size) ==
        regexp::Codepoint{0x100});
  CHECK(size == 2);
  CHECK(regexp::decode_utf8_char("\xe2\x82\xac", size) ==
        regexp::Codepoint{0x20ac});
  CHECK(size == 3);
  CHECK(regexp::decode_utf8_char("\xf0\x9f\x98\x80", size) ==
        regexp::Codepoint{0x1f600});
  CHECK(size == 4);

  // Overlong, surrogate, out of range and truncated sequences
  CHECK(not regexp::decode_utf8_char("\xc0\x80", size).has_value());
  CHECK(not regexp::decode_utf8_char("\xe0\x80\x80", size).has_value());
  CHECK(not regexp::decode_utf8_char("\xed\xa0\x80", size).has_value());
  CHECK(not regexp::decode_utf8_char("\xf4\x90\x80\x80", size).has_value());
  CHECK(not regexp::decode_utf8_char("\xe2\x82", size).has_value());
  CHECK(not regexp::decode_utf8_char("\x80", size).has_value());
  CHECK(not regexp::decode_utf8_char("\xff", size).has_value());

  CHECK(regexp::find_invalid_utf8("ab\xc4\x80" "c") == std::nullopt);
  CHECK(regexp::find_invalid_utf8("ab\xc4" "c") == 2U);
}

TEST_CASE(encode_utf8, "[regexp][unicode]") {
  std::string output;
  regexp::codepoint_to_utf8(output, regexp::Codepoint{'a'});
  regexp::codepoint_to_utf8(output, regexp::Codepoint{0x100});
  regexp::codepoint_to_utf8(output, regexp::Codepoint{0x20ac});
  regexp::codepoint_to_utf8(output, regexp::Codepoint{0x1f600});
  CHECK(output == "a\xc4\x80\xe2\x82\xac\xf0\x9f\x98\x80");

  CHECK(throws<regexp::ArgumentError>([&] {
    regexp::codepoint_to_utf8(output, regexp::Codepoint{0xd800});
  }));
  CHECK(throws<regexp::ArgumentError>([&] {
    regexp::codepoint_to_utf8(output, regexp::Codepoint{0x110000});
  }));
}

TEST_CASE(dot_matches_code_point, "[regexp][unicode]") {
  CHECK(does_match(R"(.)", "Ā", regexp::RE_UTF));
  CHECK(does_match(R"(.)", "€", regexp::RE_UTF));
  CHECK(does_match(R"(.)", "😀", regexp::RE_UTF));
  CHECK(!does_match(R"(.)", "Ā"));
  CHECK(does_match(R"(a.c)", "a€c", regexp::RE_UTF));
  CHECK(does_match(R"(.{3})", "ĀĀĀ", regexp::RE_UTF));
  CHECK(!does_match(R"(.{3})", "ĀĀĀ"));
}

TEST_CASE(code_point_literals_and_classes, "[regexp][unicode]") {
  CHECK(does_match(R"(€+)", "€€€", regexp::RE_UTF));
  // Without RE_UTF the quantifier only repeats the last byte
  CHECK(!does_match(R"(€+)", "€€€"));
  CHECK(does_match(R"(€+)", "€\xac\xac"));
  CHECK(does_match(R"([Ā-ą]+)", "ĀāĂ", regexp::RE_UTF));
  CHECK(!does_match(R"([Ā-ą])", "a", regexp::RE_UTF));
  CHECK(does_match(R"([^a])", "€", regexp::RE_UTF));
  CHECK(!does_match(R"([^a])", "€"));
  CHECK(does_match(R"([^a]{3})", "€"));
  CHECK(does_match(R"(\xe9)", "é", regexp::RE_UTF));
  CHECK(does_match(R"(\W)", "é", regexp::RE_UTF));

  // Case folding stays within ASCII
  CHECK(does_match(R"(é)", "é", regexp::RE_UTF | regexp::RE_CASELESS));
  CHECK(!does_match(R"(é)", "É", regexp::RE_UTF | regexp::RE_CASELESS));
  CHECK(does_match(R"(Ab)", "aB", regexp::RE_UTF | regexp::RE_CASELESS));
}

TEST_CASE(captures_are_byte_offsets, "[regexp][unicode]") {
  auto compiled = regexp::RegExp{R"((?P<k>é+))", regexp::RE_UTF};
  auto result = compiled.search("xééy");
  REQUIRE(result);
  CHECK(has_span(result, 1, 1, 5));
  CHECK(compiled.named_text(result, "k") == "éé"sv);

  auto collected = compiled.collect_named("xééy", "k");
  CHECK(collected.at("k") == "éé");
}

TEST_CASE(invalid_pattern_encoding, "[regexp][unicode][errors]") {
  CHECK(encoding_error_offset(
            [] { regexp::RegExp{"\xff", regexp::RE_UTF}; }) == 0);
  CHECK(encoding_error_offset(
            [] { regexp::RegExp{"ab\xc3", regexp::RE_UTF}; }) == 2);
  CHECK(encoding_error_offset(
            [] { regexp::RegExp{"a\xc0\x80", regexp::RE_UTF}; }) == 1);
  CHECK(encoding_error_offset(
            [] { regexp::RegExp{"\xed\xa0\x80", regexp::RE_UTF}; }) == 0);

  // Without RE_UTF any byte sequence is a valid pattern
  CHECK(does_match("\xff+", "\xff\xff"));
}

TEST_CASE(invalid_subject_encoding, "[regexp][unicode][errors]") {
  auto compiled = regexp::RegExp{"a", regexp::RE_UTF};
  CHECK(encoding_error_offset([&] { compiled.search("a\xff"); }) == 1);
  CHECK(encoding_error_offset([&] { compiled.full_match("\xe2\x82"); }) == 0);
  CHECK(encoding_error_offset([&] { compiled.match_at("ab\x80", 0); }) == 2);

  // The handle stays usable after a failed match
  CHECK(compiled.search("xa"));

  auto bytes = regexp::RegExp{"a"};
  CHECK(bytes.search("\xff" "a"));
}

TEST_CASE(start_offset_inside_sequence, "[regexp][unicode][errors]") {
  auto compiled = regexp::RegExp{"b", regexp::RE_UTF};
  CHECK(encoding_error_offset([&] { compiled.search("Āb", 1); }) == 1);
  CHECK(compiled.search("Āb", 2));
  CHECK(throws<regexp::ArgumentError>([&] { compiled.search("Āb", 4); }));
}
