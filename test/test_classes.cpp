#include "regexp/regexp.hpp"

#include "regexp_test_common.hpp"
#include "testing.hpp"

#include <string_view>

using namespace std::literals;

TEST_CASE(basic_digit, "[regexp][classes]") {
  CHECK(does_match(R"(\d)", "7"));
  CHECK(!does_match(R"(\d)", "a"));
  CHECK(!does_match(R"(\d)", "_"));

  CHECK(!does_match(R"(\D)", "7"));
  CHECK(does_match(R"(\D)", "a"));
  CHECK(does_match(R"(\D)", "_"));
}

TEST_CASE(basic_whitespace, "[regexp][classes]") {
  CHECK(does_match(R"(\s)", "\t"));
  CHECK(does_match(R"(\s)", " "));
  CHECK(does_match(R"(\s)", "\n"));
  CHECK(does_match(R"(\s)", "\r"));
  CHECK(does_match(R"(\s)", "\v"));
  // Perl classes are ASCII only, also in UTF mode
  CHECK(!does_match(R"(\s)", "\u2008", regexp::RE_UTF));

  CHECK(!does_match(R"(\s)", "_"));
  CHECK(does_match(R"(\S)", "9"));
  CHECK(!does_match(R"(\S)", "\t"));
}

TEST_CASE(basic_alphanumeric, "[regexp][classes]") {
  CHECK(does_match(R"(\w+)", "_09abcABC"));
  CHECK(!does_match(R"(\w+)", "Ā"));
  CHECK(does_match(R"(\W)", " "));
}

TEST_CASE(custom_grouping, "[regexp][classes][custom]") {
  CHECK(does_match(R"([_0-9a-zA-Z@]+)", "_09abcABC@"));
  CHECK(!does_match(R"([_0-9a-zA-Z@]+)", "!"));
  CHECK(!does_match(R"([^_0-9a-zA-Z@]+)", "123"));

  CHECK(does_match(R"([\w]+)", "_09abcABC"));
  CHECK(!does_match(R"([\w])", "@"));
  CHECK(does_match(R"([^\w]+)", "!!!"));

  CHECK(does_match(R"([\w\s]+)", "a9b cABC"));
  CHECK(!does_match(R"([\w\s]+)", "a9b c@ABC"));
  CHECK(!does_match(R"([^\w\s]+)", "abc"));
}

TEST_CASE(bracket_edge_cases, "[regexp][classes]") {
  CHECK(does_match(R"([]a]+)", "]a]"));
  CHECK(!does_match(R"([^]a])", "]"));
  CHECK(does_match(R"([^]a])", "b"));
  CHECK(does_match(R"([a-]+)", "a-a"));
  CHECK(does_match(R"([-a]+)", "-a"));
  CHECK(does_match(R"([\]]+)", "]]"));
  CHECK(does_match(R"([.*+?])", "*"));
  CHECK(!does_match(R"([.*+?])", "a"));
}

TEST_CASE(escapes, "[regexp][classes]") {
  CHECK(does_match(R"(\x41\x62)", "Ab"));
  CHECK(does_match(R"([\x30-\x39]+)", "0123"));
  CHECK(does_match(R"(\t\n\r\f\v)", "\t\n\r\f\v"));
  CHECK(does_match(R"(a\0b)", "a\0b"sv));
  CHECK(does_match(R"(\.\*\+\?\(\)\[\]\{\}\|\^\$\\)", ".*+?()[]{}|^$\\"));
  CHECK(!does_match(R"(\.)", "a"));
}

TEST_CASE(byte_mode_units, "[regexp][classes]") {
  // Without RE_UTF a multi-byte character is several units
  CHECK(does_match(R"(..)", "\xc4\x80"));
  CHECK(!does_match(R"(.)", "\xc4\x80"));
  CHECK(does_match(R"([\x80-\xff]+)", "\xc4\x80"));
  CHECK(does_match(R"([^a])", "\xff"));
}
