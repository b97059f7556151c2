#pragma once

#include "entry.hpp"
#include "quantile_errors.hpp"
#include "quantile_summary.hpp"
#include "rank.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

// Exact baseline: keeps every observation and sorts on demand.
// Const queries may be issued from several threads; the first one sorts under a lock.
template <typename T> class NaiveSummary : public QuantileSummary<T> {
  public:
    NaiveSummary() : m_sorted(true) {}

    NaiveSummary(const NaiveSummary &other) : QuantileSummary<T>(other) {
        std::lock_guard<std::mutex> lock(other.m_sort_mutex);
        m_values = other.m_values;
        m_sorted = other.m_sorted;
    }

    NaiveSummary(NaiveSummary &&other) noexcept : QuantileSummary<T>(std::move(other)), m_values(std::move(other.m_values)), m_sorted(other.m_sorted) {
        other.m_values.clear();
        other.m_sorted = true;
    }

    NaiveSummary &operator=(const NaiveSummary &other) {
        if (this == &other) return *this;
        std::scoped_lock lock(m_sort_mutex, other.m_sort_mutex);
        m_values = other.m_values;
        m_sorted = other.m_sorted;
        return *this;
    }

    NaiveSummary &operator=(NaiveSummary &&other) noexcept {
        if (this == &other) return *this;
        m_values = std::move(other.m_values);
        m_sorted = other.m_sorted;
        other.m_values.clear();
        other.m_sorted = true;
        return *this;
    }

    void update(const T &value) override {
        if (!is_orderable(value)) { throw InvalidValueError("Cannot insert a non-orderable value (NaN) into a naive summary."); }
        m_values.push_back(value);
        m_sorted = false;
    }

    void merge(const QuantileSummary<T> &other) override {
        const auto *other_naive = dynamic_cast<const NaiveSummary *>(&other);
        if (!other_naive) { throw IncompatibleMergeError("Can only merge NaiveSummary with another NaiveSummary."); }
        std::vector<T> values;
        {
            std::lock_guard<std::mutex> lock(other_naive->m_sort_mutex);
            values = other_naive->m_values;
        }
        m_values.insert(m_values.end(), values.begin(), values.end());
        m_sorted = false;
    }

    void merge(NaiveSummary &&other) {
        if (&other == this) {
            merge(static_cast<const QuantileSummary<T> &>(other));
            return;
        }
        m_values.insert(m_values.end(), other.m_values.begin(), other.m_values.end());
        m_sorted = false;
        other.m_values.clear();
    }

    T get_quantile(double phi) const override {
        const uint64_t rank = quantile_to_rank(phi, m_values.size());
        if (m_values.empty()) { throw EmptyQueryError("Cannot query a quantile of an empty naive summary."); }
        _sort();
        return m_values[rank - 1];
    }

    double get_rank(const T &value) const override {
        if (m_values.empty()) return 0.0;
        _sort();
        auto it = std::upper_bound(m_values.begin(), m_values.end(), value);
        return static_cast<double>(it - m_values.begin()) / static_cast<double>(m_values.size());
    }

    uint64_t get_n() const override { return m_values.size(); }

    uint64_t get_max_memory_usage() const { return m_values.capacity() * sizeof(T); }

  private:
    void _sort() const {
        std::lock_guard<std::mutex> lock(m_sort_mutex);
        if (m_sorted) return;
        std::sort(m_values.begin(), m_values.end());
        m_sorted = true;
    }

    mutable std::vector<T> m_values;
    mutable bool m_sorted;
    mutable std::mutex m_sort_mutex;
};
