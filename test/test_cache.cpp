#include "regexp/cache.hpp"
#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include "regexp_test_common.hpp"
#include "testing.hpp"

#include <map>
#include <string>
#include <string_view>

using namespace std::literals;

TEST_CASE(cache_reuses_compiled_patterns, "[regexp][cache]") {
  auto cache = regexp::RegExpCache{4};
  CHECK(cache.capacity() == 4);
  CHECK(cache.size() == 0);

  auto first = cache.get(R"((?P<k>\d+))");
  auto second = cache.get(R"((?P<k>\d+))");
  CHECK(first == second);
  CHECK(cache.size() == 1);
  CHECK(cache.contains(R"((?P<k>\d+))"));

  auto collected = first->collect_named("ab 12", "k");
  CHECK(collected.at("k") == "12");
}

TEST_CASE(cache_keys_include_flags, "[regexp][cache]") {
  auto cache = regexp::RegExpCache{4};
  auto plain = cache.get("abc");
  auto caseless = cache.get("abc", regexp::RE_CASELESS);
  CHECK(plain != caseless);
  CHECK(cache.size() == 2);
  CHECK(!plain->search("ABC"));
  CHECK(caseless->search("ABC"));
  CHECK(not cache.contains("abc", regexp::RE_UTF));
}

TEST_CASE(cache_evicts_least_recently_used, "[regexp][cache]") {
  auto cache = regexp::RegExpCache{2};
  auto a = cache.get("a");
  cache.get("b");
  cache.get("a");
  cache.get("c");

  CHECK(cache.size() == 2);
  CHECK(cache.contains("a"));
  CHECK(not cache.contains("b"));
  CHECK(cache.contains("c"));
  CHECK(cache.get("a") == a);

  // Evicted handles stay usable
  auto b = cache.get("b");
  CHECK(not cache.contains("c"));
  CHECK(b->search("xb"));
}

TEST_CASE(cache_does_not_store_failures, "[regexp][cache]") {
  auto cache = regexp::RegExpCache{2};
  CHECK(throws<regexp::SyntaxError>([&] { cache.get("(?D<key>.*)"); }));
  CHECK(throws<regexp::ArgumentError>([&] { cache.get("a", 0x1); }));
  CHECK(cache.size() == 0);
  CHECK(not cache.contains("(?D<key>.*)"));
}

TEST_CASE(cache_evict_and_clear, "[regexp][cache]") {
  auto cache = regexp::RegExpCache{3};
  auto held = cache.get("x+");
  cache.get("y+");

  CHECK(cache.evict("x+"));
  CHECK(not cache.evict("x+"));
  CHECK(not cache.evict("y+", regexp::RE_DOTALL));
  CHECK(cache.size() == 1);
  CHECK(held->full_match("xxx"));

  cache.clear();
  CHECK(cache.size() == 0);
  CHECK(cache.get("x+") != held);
}

TEST_CASE(cache_rejects_zero_capacity, "[regexp][cache]") {
  CHECK(throws<regexp::ArgumentError>([] { regexp::RegExpCache{0}; }));
}
