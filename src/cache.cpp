#include "regexp/cache.hpp"

#include "private/logging.hpp"
#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

using namespace regexp;

RegExpCache::RegExpCache(size_t capacity) : m_capacity{capacity} {
  if (capacity == 0) {
    throw ArgumentError("cache capacity must be at least 1");
  }
}

auto RegExpCache::get(std::string_view pattern, unsigned long flags)
    -> std::shared_ptr<RegExp const> {
  auto key = Key{std::string{pattern}, flags};
  {
    std::lock_guard lock{m_mutex};
    if (auto iter = m_index.find(key); iter != m_index.end()) {
      // Move to the front
      m_entries.splice(m_entries.begin(), m_entries, iter->second);
      REGEXP_LOG(debug, "Cache hit for \"", pattern, "\"");
      return iter->second->second;
    }
  }

  // Compile outside the lock. Errors propagate and nothing is cached.
  REGEXP_LOG(debug, "Cache miss for \"", pattern, "\"");
  auto compiled = std::make_shared<RegExp const>(pattern, flags);

  std::lock_guard lock{m_mutex};
  if (auto iter = m_index.find(key); iter != m_index.end()) {
    // Another thread compiled the same pattern meanwhile
    m_entries.splice(m_entries.begin(), m_entries, iter->second);
    return iter->second->second;
  }

  m_entries.emplace_front(key, compiled);
  m_index.emplace(std::move(key), m_entries.begin());

  while (m_entries.size() > m_capacity) {
    auto const &oldest = m_entries.back();
    REGEXP_LOG(info, "Evicting \"", oldest.first.first, "\" from cache");
    m_index.erase(oldest.first);
    m_entries.pop_back();
  }
  return compiled;
}

auto RegExpCache::evict(std::string_view pattern, unsigned long flags)
    -> bool {
  std::lock_guard lock{m_mutex};
  auto iter = m_index.find(Key{std::string{pattern}, flags});
  if (iter == m_index.end()) {
    return false;
  }
  m_entries.erase(iter->second);
  m_index.erase(iter);
  return true;
}

auto RegExpCache::clear() -> void {
  std::lock_guard lock{m_mutex};
  m_index.clear();
  m_entries.clear();
}

auto RegExpCache::contains(std::string_view pattern, unsigned long flags) const
    -> bool {
  std::lock_guard lock{m_mutex};
  return m_index.find(Key{std::string{pattern}, flags}) != m_index.end();
}

auto RegExpCache::size() const -> size_t {
  std::lock_guard lock{m_mutex};
  return m_entries.size();
}
