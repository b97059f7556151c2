#pragma once

#include "entry.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// Streaming compressor for the modified GK variant. Entries must be pushed in sorted
// order; consecutive entries are folded into the later one while the folded block
// keeps g + delta <= cap. The first entry (minimum) is committed untouched.
//
// A fold may lower the block's delta (the block takes the delta of its last entry),
// in which case the previously committed entry is tested again. The output therefore
// satisfies prev.g + next.g + next.delta > cap for every adjacent pair after the
// minimum, and compressing it again is a no-op.
template <typename T> class EntryCompressor {
  public:
    explicit EntryCompressor(uint64_t cap, size_t expected_size = 0) : m_cap(cap) {
        if (expected_size > 0) m_committed.reserve(expected_size);
    }

    void push(Entry<T> entry) {
        if (m_block_tail) {
            if (m_block_tail->g + entry.g + entry.delta <= m_cap) {
                entry.g += m_block_tail->g;
                m_block_tail = std::move(entry);
                _absorb_committed();
            } else {
                m_committed.push_back(std::move(*m_block_tail));
                m_block_tail = std::move(entry);
            }
        } else if (m_committed.empty()) {
            m_committed.push_back(std::move(entry));
        } else {
            m_block_tail = std::move(entry);
        }
    }

    std::vector<Entry<T>> finish() {
        if (m_block_tail) {
            m_committed.push_back(std::move(*m_block_tail));
            m_block_tail.reset();
        }
        return std::move(m_committed);
    }

    uint64_t get_cap() const { return m_cap; }

  private:
    void _absorb_committed() {
        while (m_committed.size() > 1 && m_committed.back().g + m_block_tail->g + m_block_tail->delta <= m_cap) {
            m_block_tail->g += m_committed.back().g;
            m_committed.pop_back();
        }
    }

    uint64_t m_cap;
    std::vector<Entry<T>> m_committed;
    std::optional<Entry<T>> m_block_tail;
};
