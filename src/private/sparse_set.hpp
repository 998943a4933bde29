#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace regexp {
// Set of small integers with O(1) insert, lookup and clear. Iteration yields
// elements in insertion order, which the matcher relies on for thread
// priority.
class SparseSet {
  std::vector<uint32_t> m_dense;
  std::vector<uint32_t> m_sparse;
  uint32_t m_size = 0;

public:
  explicit SparseSet(size_t capacity) : m_dense(capacity), m_sparse(capacity) {}

  constexpr auto contains(uint32_t value) const -> bool {
    uint32_t index = m_sparse[value];
    return index < m_size && m_dense[index] == value;
  }

  // `value` must not already be present
  constexpr auto insert(uint32_t value) -> void {
    m_sparse[value] = m_size;
    m_dense[m_size] = value;
    m_size += 1;
  }

  constexpr auto clear() -> void { m_size = 0; }

  constexpr auto size() const -> size_t { return m_size; }
  constexpr auto empty() const -> bool { return m_size == 0; }

  constexpr auto begin() const -> uint32_t const * { return m_dense.data(); }
  constexpr auto end() const -> uint32_t const * {
    return m_dense.data() + m_size;
  }
};
} // namespace regexp
