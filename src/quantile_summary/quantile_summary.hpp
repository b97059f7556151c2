#pragma once

#include <cstdint>

template <typename T> class QuantileSummary {
  public:
    virtual ~QuantileSummary() = default;

    virtual void update(const T &value) = 0;

    virtual void merge(const QuantileSummary &other) = 0;

    // Estimated fraction of observations <= value
    virtual double get_rank(const T &value) const = 0;

    virtual T get_quantile(double phi) const = 0;

    virtual uint64_t get_n() const = 0;

  protected:
    QuantileSummary() = default;
};
