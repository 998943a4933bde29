#include "regexp/cache.hpp"
#include "regexp/regexp.hpp"

#include "testing.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
constexpr size_t thread_count = 8;
constexpr size_t iterations = 200;
} // namespace

TEST_CASE(shared_handle_across_threads, "[regexp][concurrency]") {
  auto const compiled =
      regexp::RegExp{R"((?P<key>\w+)=(?P<value>\d+))", regexp::RE_UTF};
  std::atomic<size_t> failures = 0;

  std::vector<std::thread> threads;
  for (size_t t = 0; t < thread_count; t += 1) {
    threads.emplace_back([&, t] {
      for (size_t i = 0; i < iterations; i += 1) {
        auto value = std::to_string(t * iterations + i);
        auto subject = "é k" + std::to_string(t) + "=" + value + ";";
        auto collected = compiled.collect_named(subject, "value");
        auto key = compiled.collect_named(subject, "key");
        if (collected["value"] != value ||
            key["key"] != "k" + std::to_string(t)) {
          failures += 1;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  // The harness is not thread safe, so check on the main thread
  CHECK(failures == 0);
}

TEST_CASE(shared_cache_across_threads, "[regexp][concurrency][cache]") {
  auto cache = regexp::RegExpCache{4};
  std::vector<std::shared_ptr<regexp::RegExp const>> handles(thread_count);
  std::atomic<size_t> failures = 0;

  std::vector<std::thread> threads;
  for (size_t t = 0; t < thread_count; t += 1) {
    threads.emplace_back([&, t] {
      for (size_t i = 0; i < iterations; i += 1) {
        auto compiled = cache.get(R"(id=(?P<id>\d+))");
        if (compiled->collect_named("id=" + std::to_string(i), "id")["id"] !=
            std::to_string(i)) {
          failures += 1;
        }
        // Churn the other entries
        cache.get("other" + std::to_string(i % 6));
        handles[t] = compiled;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  CHECK(failures == 0);
  CHECK(cache.size() <= cache.capacity());
  for (auto const &handle : handles) {
    CHECK(handle != nullptr);
  }
}
