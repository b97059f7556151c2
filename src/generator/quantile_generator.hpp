#pragma once

#include "quantile_summary/quantile_errors.hpp"
#include "quantile_summary/rank.hpp"

#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

// Finite stream of `num` doubles whose `quantile` quantile is exactly `value`:
// after sorting, the value at rank quantile_to_rank(quantile, num) equals `value`.
// Used to feed summaries with data whose answer is known in advance.
class QuantileGenerator {
  public:
    virtual ~QuantileGenerator() = default;

    virtual bool done() const = 0;
    virtual double next() = 0;
    // Values left to produce
    virtual uint64_t remaining() const = 0;

    std::vector<double> generate_all() {
        std::vector<double> values;
        values.reserve(remaining());
        while (!done()) values.push_back(next());
        return values;
    }
};

// Values other than the target are drawn from the open intervals (value - 1, value) and
// (value, value + 1), in random order. Deterministic for a given seed.
class RandomGenerator : public QuantileGenerator {
  public:
    RandomGenerator(double quantile, double value, uint64_t num, uint64_t seed)
        : m_value(value), m_published_value(false), m_rng(seed), m_dist(0.0, 1.0) {
        if (num == 0) { throw ConfigurationError("A generator needs at least one value."); }
        m_remaining_lesser = quantile_to_rank(quantile, num) - 1;
        m_remaining = num - 1;
    }

    bool done() const override { return m_remaining == 0 && m_published_value; }

    double next() override {
        if (done()) { throw std::out_of_range("RandomGenerator exhausted."); }

        // The target value is published with probability 1 / (values left)
        if (!m_published_value && m_dist(m_rng) < 1.0 / static_cast<double>(m_remaining + 1)) {
            m_published_value = true;
            return m_value;
        }

        // Lesser and greater values keep the proportions of what is left to draw
        const double ratio = static_cast<double>(m_remaining_lesser) / static_cast<double>(m_remaining);
        m_remaining--;
        if (m_dist(m_rng) >= ratio) return _next_greater();

        m_remaining_lesser--;
        return _next_lesser();
    }

    uint64_t remaining() const override { return m_remaining + (m_published_value ? 0 : 1); }

  private:
    double _next_lesser() {
        double v = m_value;
        while (!(v < m_value && v > m_value - 1.0)) v = m_value - m_dist(m_rng);
        return v;
    }

    double _next_greater() {
        double v = m_value;
        while (!(v > m_value && v < m_value + 1.0)) v = m_value + m_dist(m_rng);
        return v;
    }

    double m_value;
    uint64_t m_remaining_lesser;
    uint64_t m_remaining; // excluding the target value
    bool m_published_value;
    std::mt19937_64 m_rng;
    std::uniform_real_distribution<double> m_dist;
};

enum class SequentialOrder { ASCENDING, DESCENDING };

// Unit-step sequence: v[i] = value + direction * i + offset
class SequentialGenerator : public QuantileGenerator {
  public:
    SequentialGenerator(double quantile, double value, uint64_t num, SequentialOrder order) : m_value(value), m_position(0), m_num(num) {
        if (num == 0) { throw ConfigurationError("A generator needs at least one value."); }
        const uint64_t rank = quantile_to_rank(quantile, num);
        if (order == SequentialOrder::ASCENDING) {
            m_direction = 1.0;
            m_offset = 1.0 - static_cast<double>(rank);
        } else {
            m_direction = -1.0;
            m_offset = static_cast<double>(num - rank);
        }
    }

    bool done() const override { return m_position == m_num; }

    double next() override {
        if (done()) { throw std::out_of_range("SequentialGenerator exhausted."); }
        // value is kept apart from the offset so it comes back exactly
        const double v = m_value + (m_direction * static_cast<double>(m_position) + m_offset);
        m_position++;
        return v;
    }

    uint64_t remaining() const override { return m_num - m_position; }

  private:
    double m_value;
    uint64_t m_position;
    uint64_t m_num;
    double m_direction;
    double m_offset;
};

// The ascending sequence in a seeded random order
class ShuffledGenerator : public QuantileGenerator {
  public:
    ShuffledGenerator(double quantile, double value, uint64_t num, uint64_t seed)
        : m_values(SequentialGenerator(quantile, value, num, SequentialOrder::ASCENDING).generate_all()), m_position(0) {
        std::mt19937_64 rng(seed);
        std::shuffle(m_values.begin(), m_values.end(), rng);
    }

    bool done() const override { return m_position == m_values.size(); }

    double next() override {
        if (done()) { throw std::out_of_range("ShuffledGenerator exhausted."); }
        return m_values[m_position++];
    }

    uint64_t remaining() const override { return m_values.size() - m_position; }

  private:
    std::vector<double> m_values;
    size_t m_position;
};
