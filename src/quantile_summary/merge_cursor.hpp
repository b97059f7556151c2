#pragma once

#include "entry.hpp"

#include <cstdint>
#include <utility>
#include <vector>

// Read position over one side of a merge.
template <typename T> class MergeCursor {
  public:
    explicit MergeCursor(std::vector<Entry<T>> &&entries) : m_entries(std::move(entries)), m_pos(0) {}

    bool done() const { return m_pos >= m_entries.size(); }

    const Entry<T> &peek() const { return m_entries[m_pos]; }

    Entry<T> pop_front() { return std::move(m_entries[m_pos++]); }

    bool has_started() const { return m_pos > 0; }

    // Extra rank uncertainty of an entry from the other side that lands before peek():
    // it may sit anywhere in the gap closed by the next entry of this side.
    uint64_t additional_delta() const {
        if (!has_started() || done()) return 0;
        const Entry<T> &next = m_entries[m_pos];
        return next.g + next.delta - 1;
    }

    template <typename Sink> void push_remaining_to(Sink &sink) {
        while (!done()) { sink.push(pop_front()); }
    }

  private:
    std::vector<Entry<T>> m_entries;
    size_t m_pos;
};
