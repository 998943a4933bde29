#pragma once

#include "regexp/regexp.hpp"

#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace regexp {
// Bounded least-recently-used cache of compiled patterns keyed by
// (pattern bytes, flags). Handles are shared, so an evicted pattern stays
// usable by whoever still holds it.
class RegExpCache {
  using Key = std::pair<std::string, unsigned long>;
  using Entry = std::pair<Key, std::shared_ptr<RegExp const>>;

  size_t m_capacity;
  std::list<Entry> m_entries; // most recently used first
  std::map<Key, std::list<Entry>::iterator> m_index;
  mutable std::mutex m_mutex;

public:
  explicit RegExpCache(size_t capacity);

  RegExpCache(RegExpCache const &) = delete;
  auto operator=(RegExpCache const &) -> RegExpCache & = delete;

  auto get(std::string_view pattern, unsigned long flags = 0)
      -> std::shared_ptr<RegExp const>;
  auto evict(std::string_view pattern, unsigned long flags = 0) -> bool;
  auto clear() -> void;

  auto contains(std::string_view pattern, unsigned long flags = 0) const
      -> bool;
  auto size() const -> size_t;
  auto capacity() const -> size_t { return m_capacity; }
};
} // namespace regexp
