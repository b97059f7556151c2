#pragma once

#include "band_compressor.hpp"
#include "entry.hpp"
#include "entry_compressor.hpp"
#include "merge_cursor.hpp"
#include "quantile_errors.hpp"
#include "quantile_summary.hpp"
#include "quantile_summary_config.hpp"
#include "rank.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// Greenwald-Khanna quantile summary (Space-Efficient Online Computation of Quantile Summaries).
//
// Holds a sorted list of entries (value, g, delta) such that, for n absorbed values,
// every interior entry keeps g + delta <= floor(2 * epsilon * n). Any quantile query is
// then answered with a rank error of at most epsilon * n.
//
// Two compression strategies are available:
//  - CLASSICAL: the published algorithm. Periodic COMPRESS driven by delta bands, merge
//    adds the local gap of the other side and needs a complete COMPRESS afterwards.
//  - MODIFIED: insertion folds the new value into its right neighbour when the bound
//    allows it, compression is a single streaming pass without bands, and merge only adds
//    the local gap of the other side, so the interleaved stream can be compressed on the fly.
template <typename T> class GKSummary : public QuantileSummary<T> {
  public:
    explicit GKSummary(double epsilon, CompressionStrategy strategy = CompressionStrategy::MODIFIED)
        : m_epsilon(epsilon), m_strategy(strategy), m_n(0), m_inserted_since_compress(0), m_num_compressions(0) {
        check_epsilon(epsilon);
        _update_limits();
    }

    explicit GKSummary(const GKConfig &config) : GKSummary(config.epsilon, config.get_strategy()) {}

    // Rebuilds a summary from a previously exported entry list; n is the sum of g.
    // The minimum must be exact, the maximum must have delta = 0 and every entry must keep
    // g + delta <= max(floor(2 * eps * n), 1).
    static GKSummary from_entries(double epsilon, CompressionStrategy strategy, std::vector<Entry<T>> entries) {
        GKSummary summary(epsilon, strategy);
        for (size_t i = 0; i < entries.size(); ++i) {
            if (!is_orderable(entries[i].value)) { throw InvalidValueError("Entry holds a non-orderable value (NaN)."); }
            if (entries[i].g == 0) { throw ConfigurationError("Entry " + std::to_string(i) + " has g = 0."); }
            if (i > 0 && entries[i].value < entries[i - 1].value) { throw ConfigurationError("Entries are not sorted by value."); }
            summary.m_n += entries[i].g;
        }
        if (entries.empty()) return summary;

        if (entries.front().g != 1 || entries.front().delta != 0) { throw ConfigurationError("The minimum entry must have g = 1 and delta = 0."); }
        if (entries.back().delta != 0) { throw ConfigurationError("The maximum entry must have delta = 0."); }
        const uint64_t cap = std::max<uint64_t>(summary.get_max_g_delta(), 1);
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].g + entries[i].delta > cap) {
                throw ConfigurationError("Entry " + std::to_string(i) + " has g + delta = " + std::to_string(entries[i].g + entries[i].delta) + " above the bound " +
                                         std::to_string(cap) + ".");
            }
        }
        summary.m_entries = std::move(entries);
        return summary;
    }

    GKSummary(const GKSummary &other) = default;
    GKSummary &operator=(const GKSummary &other) = default;
    GKSummary(GKSummary &&other) noexcept = default;
    GKSummary &operator=(GKSummary &&other) noexcept = default;

    void update(const T &value) override {
        if (!is_orderable(value)) { throw InvalidValueError("Cannot insert a non-orderable value (NaN) into a GK summary."); }

        if (m_strategy == CompressionStrategy::CLASSICAL) {
            _insert_classical(value);
        } else {
            _insert_modified(value);
        }
    }

    template <typename Iterator> void update(Iterator first, Iterator last) {
        for (; first != last; ++first) update(*first);
    }

    // Shrink the entry list in place, keeping the error bound
    void compress() {
        if (m_strategy == CompressionStrategy::CLASSICAL) {
            BandCompressor<T>(get_max_g_delta()).compress(m_entries);
        } else {
            EntryCompressor<T> compressor(get_max_g_delta(), m_entries.size());
            for (auto &entry : m_entries) compressor.push(std::move(entry));
            m_entries = compressor.finish();
        }
        m_inserted_since_compress = 0;
        m_num_compressions++;
    }

    void merge(const QuantileSummary<T> &other) override {
        const auto *other_gk = dynamic_cast<const GKSummary *>(&other);
        if (!other_gk) { throw IncompatibleMergeError("Can only merge GKSummary with another GKSummary."); }
        GKSummary copy(*other_gk);
        merge(std::move(copy));
    }

    // Absorb `other`, which is left empty. The result carries max(epsilon, other.epsilon).
    void merge(GKSummary &&other) {
        if (m_strategy != other.m_strategy) {
            throw IncompatibleMergeError("GK summaries must use the same compression strategy to be merged (" + to_string(m_strategy) + " vs " +
                                         to_string(other.m_strategy) + ").");
        }
        if (&other == this) {
            GKSummary copy(other);
            merge(std::move(copy));
            return;
        }

        if (m_strategy == CompressionStrategy::CLASSICAL) {
            _merge_classical(other);
        } else {
            _merge_modified(other);
        }

        other.m_entries.clear();
        other.m_n = 0;
        other.m_inserted_since_compress = 0;
    }

    // Returns the chosen value and its worst-case rank error as a fraction of n
    std::pair<T, double> get_quantile_with_error(double phi) const {
        const uint64_t target_rank = quantile_to_rank(phi, m_n);
        if (m_n == 0) { throw EmptyQueryError("Cannot query a quantile of an empty GK summary."); }

        // Pick the entry with the smallest worst-case rank error
        const Entry<T> *best = nullptr;
        uint64_t best_error = std::numeric_limits<uint64_t>::max();
        uint64_t min_rank = 0;
        for (const auto &entry : m_entries) {
            min_rank += entry.g;
            const uint64_t max_rank = min_rank + entry.delta;
            const uint64_t error = std::max(_abs_diff(target_rank, min_rank), _abs_diff(target_rank, max_rank));
            if (error < best_error) {
                best = &entry;
                best_error = error;
            }
        }

        return {best->value, static_cast<double>(best_error) / static_cast<double>(m_n)};
    }

    T get_quantile(double phi) const override { return get_quantile_with_error(phi).first; }

    double get_rank(const T &value) const override {
        if (m_n == 0) return 0.0;

        uint64_t min_rank = 0;
        uint64_t delta = 0;
        for (const auto &entry : m_entries) {
            if (value < entry.value) break;
            min_rank += entry.g;
            delta = entry.delta;
        }
        return (static_cast<double>(min_rank) + static_cast<double>(delta) / 2.0) / static_cast<double>(m_n);
    }

    uint64_t get_n() const override { return m_n; }
    bool is_empty() const { return m_n == 0; }
    double get_epsilon() const { return m_epsilon; }
    CompressionStrategy get_strategy() const { return m_strategy; }
    uint32_t get_num_retained() const { return static_cast<uint32_t>(m_entries.size()); }
    uint32_t get_num_compressions() const { return m_num_compressions; }
    const std::vector<Entry<T>> &get_entries() const { return m_entries; }

    // Current bound on g + delta
    uint64_t get_max_g_delta() const { return max_g_delta(m_epsilon, m_n); }

    uint64_t get_max_memory_usage() const { return m_entries.capacity() * sizeof(Entry<T>); }

    friend std::ostream &operator<<(std::ostream &os, const GKSummary &summary) {
        os << "GK Summary (" << to_string(summary.m_strategy) << "):" << std::endl;
        os << "  epsilon: " << summary.m_epsilon << std::endl;
        os << "  count: " << summary.m_n << std::endl;
        os << "  retained: " << summary.m_entries.size() << std::endl;
        os << "  compressions: " << summary.m_num_compressions << std::endl;

        const uint64_t max_err = static_cast<uint64_t>(std::floor(summary.m_epsilon * static_cast<double>(summary.m_n)));
        const uint32_t max_entries_to_show = 20;
        os << "  " << std::setw(20) << "value" << std::setw(10) << "[min_rank" << std::setw(10) << "max_rank]" << std::setw(8) << "g" << std::setw(8) << "delta"
           << std::setw(12) << "[min_query" << std::setw(12) << "max_query]" << std::endl;
        uint64_t min_rank = 0;
        for (size_t i = 0; i < summary.m_entries.size(); ++i) {
            const auto &entry = summary.m_entries[i];
            min_rank += entry.g;
            if (i >= max_entries_to_show) continue;
            os << "  " << std::setw(20) << entry.value << std::setw(10) << min_rank << std::setw(10) << min_rank + entry.delta << std::setw(8) << entry.g
               << std::setw(8) << entry.delta << std::setw(12) << static_cast<int64_t>(min_rank + entry.delta) - static_cast<int64_t>(max_err) << std::setw(12)
               << min_rank + max_err << std::endl;
        }
        if (summary.m_entries.size() > max_entries_to_show) { os << "  ... (" << summary.m_entries.size() - max_entries_to_show << " more)" << std::endl; }
        return os;
    }

  private:
    static uint64_t _abs_diff(uint64_t a, uint64_t b) { return a > b ? a - b : b - a; }

    void _update_limits() {
        // CLASSICAL: COMPRESS every 1/(2 eps) insertions.
        // MODIFIED: micro-compression keeps growth slow (a sorted stream of F = 1/eps values
        // ends with about F entries, 6F values with 2F, 42F with 3F, ...), so a full pass
        // is only needed past 5F entries.
        m_compress_period = static_cast<uint64_t>(std::ceil(1.0 / (2.0 * m_epsilon)));
        m_max_entries = 5 * static_cast<uint64_t>(std::ceil(1.0 / m_epsilon));
    }

    void _insert_classical(const T &value) {
        if (m_inserted_since_compress >= m_compress_period) compress();
        m_n++;
        m_inserted_since_compress++;

        if (m_entries.empty() || value < m_entries.front().value) {
            m_entries.insert(m_entries.begin(), Entry<T>::exact(value));
            return;
        }
        if (!(value < m_entries.back().value)) {
            m_entries.push_back(Entry<T>::exact(value));
            return;
        }

        // v[pos - 1] <= value < v[pos]
        auto pos = std::upper_bound(m_entries.begin(), m_entries.end(), value, [](const T &v, const Entry<T> &entry) { return v < entry.value; });

        uint64_t delta = 0;
        const bool exact_phase = m_num_compressions == 0 && 2.0 * m_epsilon * static_cast<double>(m_n) < 1.0;
        if (!exact_phase) {
            const uint64_t cap = get_max_g_delta();
            delta = cap > 0 ? cap - 1 : 0;
        }
        m_entries.insert(pos, Entry<T>{value, 1, delta});
    }

    void _insert_modified(const T &value) {
        m_n++;
        m_inserted_since_compress++;
        const uint64_t cap = get_max_g_delta();

        if (m_entries.empty()) {
            m_entries.push_back(Entry<T>::exact(value));
        } else if (value < m_entries.front().value) {
            // New minimum: the old one may be folded into its right neighbour
            if (m_entries.size() > 1 && m_entries[1].g + m_entries[1].delta + 1 <= cap) {
                m_entries[1].g++;
                m_entries[0].value = value;
            } else {
                m_entries.insert(m_entries.begin(), Entry<T>::exact(value));
            }
        } else if (!(value < m_entries.back().value)) {
            // New maximum: the old one may be folded into it, never the minimum itself
            Entry<T> &max = m_entries.back();
            if (m_entries.size() > 1 && max.g + max.delta + 1 <= cap) {
                max.g++;
                max.value = value;
            } else {
                m_entries.push_back(Entry<T>::exact(value));
            }
        } else {
            auto pos = std::upper_bound(m_entries.begin() + 1, m_entries.end(), value, [](const T &v, const Entry<T> &entry) { return v < entry.value; });
            Entry<T> &right = *pos;
            if (right.g + right.delta + 1 <= cap) {
                right.g++;
            } else {
                const uint64_t delta = right.g + right.delta - 1;
                m_entries.insert(pos, Entry<T>{value, 1, delta});
            }
        }

        if (m_entries.size() > m_max_entries) compress();
    }

    void _merge_modified(GKSummary &other) {
        m_n += other.m_n;
        m_epsilon = std::max(m_epsilon, other.m_epsilon);
        _update_limits();

        EntryCompressor<T> compressor(get_max_g_delta(), m_entries.size() + other.m_entries.size());
        MergeCursor<T> self_input(std::move(m_entries));
        MergeCursor<T> other_input(std::move(other.m_entries));

        while (!self_input.done() && !other_input.done()) {
            if (self_input.peek().value < other_input.peek().value) {
                Entry<T> entry = self_input.pop_front();
                entry.delta += other_input.additional_delta();
                compressor.push(std::move(entry));
            } else {
                Entry<T> entry = other_input.pop_front();
                entry.delta += self_input.additional_delta();
                compressor.push(std::move(entry));
            }
        }

        // At most one side has entries left
        self_input.push_remaining_to(compressor);
        other_input.push_remaining_to(compressor);
        m_entries = compressor.finish();
    }

    // Same interleave as the modified merge: an entry landing inside a gap of the other side
    // takes that gap's uncertainty, next.g + next.delta - 1. The interleaved list is then
    // handed to a complete classical COMPRESS.
    void _merge_classical(GKSummary &other) {
        std::vector<Entry<T>> merged;
        merged.reserve(m_entries.size() + other.m_entries.size());

        MergeCursor<T> self_input(std::move(m_entries));
        MergeCursor<T> other_input(std::move(other.m_entries));
        while (!self_input.done() && !other_input.done()) {
            if (self_input.peek().value < other_input.peek().value) {
                Entry<T> entry = self_input.pop_front();
                entry.delta += other_input.additional_delta();
                merged.push_back(std::move(entry));
            } else {
                Entry<T> entry = other_input.pop_front();
                entry.delta += self_input.additional_delta();
                merged.push_back(std::move(entry));
            }
        }
        while (!self_input.done()) merged.push_back(self_input.pop_front());
        while (!other_input.done()) merged.push_back(other_input.pop_front());

        m_entries = std::move(merged);
        m_n += other.m_n;
        m_epsilon = std::max(m_epsilon, other.m_epsilon);
        _update_limits();
        compress();
    }

    double m_epsilon;
    CompressionStrategy m_strategy;
    uint64_t m_n;
    std::vector<Entry<T>> m_entries;

    uint64_t m_compress_period;
    uint64_t m_max_entries;
    uint64_t m_inserted_since_compress;
    uint32_t m_num_compressions;
};

// Consumes both inputs
template <typename T> GKSummary<T> merge_summaries(GKSummary<T> a, GKSummary<T> b) {
    a.merge(std::move(b));
    return a;
}
