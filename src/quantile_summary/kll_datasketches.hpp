#pragma once

#include "quantile_errors.hpp"
#include "quantile_summary.hpp"
#include "quantile_summary_config.hpp"

#include <kll_sketch.hpp>

#include <cmath>
#include <ostream>
#include <stdexcept>
#include <string>

// Adapter around the Apache DataSketches KLL sketch, used as a randomized baseline
// next to the deterministic GK summaries
class KLL : public QuantileSummary<double>
{
public:
    explicit KLL(const KLLConfig &config) : m_config(config), m_sketch(_checked_k(config.k)) {}

    KLL() : m_config({200}), m_sketch(200) {}

    KLL(const KLL &other) = default;
    KLL &operator=(const KLL &other) = default;
    KLL(KLL &&other) = default;
    KLL &operator=(KLL &&other) = default;

    void update(const double &value) override
    {
        if (std::isnan(value)) { throw InvalidValueError("Cannot insert a non-orderable value (NaN) into a KLL sketch."); }
        m_sketch.update(value);
    }

    void merge(const QuantileSummary<double> &other) override
    {
        const auto *other_kll = dynamic_cast<const KLL *>(&other);
        if (!other_kll) { throw IncompatibleMergeError("Can only merge KLL with another KLL."); }
        merge(*other_kll);
    }

    void merge(const KLL &other_kll)
    {
        if (m_config.k != other_kll.m_config.k) { throw IncompatibleMergeError("KLL sketches must have the same k parameter to be merged."); }
        m_sketch.merge(other_kll.m_sketch);
    }

    void merge(KLL &&other_kll)
    {
        if (m_config.k != other_kll.m_config.k) { throw IncompatibleMergeError("KLL sketches must have the same k parameter to be merged."); }
        m_sketch.merge(std::move(other_kll.m_sketch));
    }

    double get_quantile(double phi) const override
    {
        if (!(phi >= 0.0 && phi <= 1.0)) { throw ConfigurationError("Invalid quantile: out of range [0, 1]"); }
        if (m_sketch.is_empty()) { throw EmptyQueryError("Cannot query a quantile of an empty KLL sketch."); }
        return m_sketch.get_quantile(phi);
    }

    double get_rank(const double &value) const override
    {
        if (m_sketch.is_empty()) return 0.0;
        return m_sketch.get_rank(value);
    }

    uint64_t get_n() const override { return m_sketch.get_n(); }

    const KLLConfig &get_config() const { return m_config; }

    // Retained items times the item size
    uint64_t get_max_memory_usage() const { return static_cast<uint64_t>(m_sketch.get_num_retained()) * sizeof(double); }

    // Access to underlying sketch
    const datasketches::kll_sketch<double> &get_sketch() const { return m_sketch; }

    bool is_empty() const { return m_sketch.is_empty(); }
    uint32_t get_k() const { return m_sketch.get_k(); }
    uint32_t get_num_retained() const { return m_sketch.get_num_retained(); }
    double get_normalized_rank_error() const { return m_sketch.get_normalized_rank_error(false); }

    friend std::ostream &operator<<(std::ostream &os, const KLL &kll)
    {
        os << "KLL Sketch (Apache DataSketches):" << std::endl;
        os << "  k: " << kll.m_config.k << std::endl;
        os << "  count: " << kll.m_sketch.get_n() << std::endl;
        os << "  retained: " << kll.m_sketch.get_num_retained() << std::endl;
        return os;
    }

private:
    static uint16_t _checked_k(uint32_t k)
    {
        if (k < 8 || k > 65535) { throw ConfigurationError("KLL k must be in [8, 65535], got " + std::to_string(k)); }
        return static_cast<uint16_t>(k);
    }

    KLLConfig m_config;
    datasketches::kll_sketch<double> m_sketch;
};
