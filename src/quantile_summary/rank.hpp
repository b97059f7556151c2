#pragma once

#include "quantile_errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

// Ranks are 1-based. For num = 4:
//   [0, 1/4] -> 1, (1/4, 2/4] -> 2, (2/4, 3/4] -> 3, (3/4, 1] -> 4
inline uint64_t quantile_to_rank(double quantile, uint64_t num) {
    if (!(quantile >= 0.0 && quantile <= 1.0)) { throw ConfigurationError("Invalid quantile " + std::to_string(quantile) + ": out of range [0, 1]"); }
    return std::max<uint64_t>(static_cast<uint64_t>(std::ceil(quantile * static_cast<double>(num))), 1);
}

// Inverse of quantile_to_rank: rank 1 maps to 0, rank r to r / num.
inline double rank_to_quantile(uint64_t rank, uint64_t num) {
    if (rank == 0 || rank > num) { throw ConfigurationError("Invalid rank " + std::to_string(rank) + ": out of range [1, " + std::to_string(num) + "]"); }
    if (rank == 1) return 0.0;
    return static_cast<double>(rank) / static_cast<double>(num);
}

// Upper bound on g + delta of every interior entry of a summary over num values.
inline uint64_t max_g_delta(double epsilon, uint64_t num) { return static_cast<uint64_t>(std::floor(2.0 * epsilon * static_cast<double>(num))); }

inline void check_epsilon(double epsilon) {
    if (!(epsilon > 0.0 && epsilon < 1.0)) { throw ConfigurationError("epsilon must be in (0, 1), got " + std::to_string(epsilon)); }
}
