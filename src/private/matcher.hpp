#pragma once

#include "private/program.hpp"
#include "regexp/regexp.hpp"

#include <cstddef>
#include <string_view>

namespace regexp {
enum class Anchor {
  unanchored, // search forward from the start offset
  start,      // the match must begin at the start offset
  both,       // ... and end at the end of the text
};

// Runs `program` over `text` from `start_offset`. A failed match is reported
// through MatchResult::did_match. Throws EncodingError for invalid UTF-8 in
// RE_UTF mode and ArgumentError for offsets past the end of `text`.
auto run(Program const &program, std::string_view text, size_t start_offset,
         Anchor anchor) -> MatchResult;
} // namespace regexp
