#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// JSON Library
#include <nlohmann/json.hpp>

#include "generator/quantile_generator.hpp"
#include "parallel/summary_reducer.hpp"
#include "quantile_summary/gk_summary.hpp"
#include "quantile_summary/kll_datasketches.hpp"
#include "quantile_summary/naive_summary.hpp"
#include "quantile_summary/rank.hpp"

using json = nlohmann::json;

// Timer class to measure execution time
class Timer {
  public:
    void start() { m_start = std::chrono::high_resolution_clock::now(); }
    double stop_s() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(end - m_start).count();
    }

  private:
    std::chrono::time_point<std::chrono::high_resolution_clock> m_start;
};

// Median of every generated stream
constexpr double DATASET_CENTER = 17.0;

// Data generation functions
// generator: random | ascending | descending | shuffled
std::unique_ptr<QuantileGenerator> make_generator(const std::string &generator, uint64_t num, uint64_t seed);
std::vector<double> generate_dataset(const std::string &generator, uint64_t num, uint64_t seed);

// Shard `worker_id` of a dataset split over `num_workers`, generated independently with seed + worker_id
std::vector<double> generate_shard(const std::string &generator, uint64_t total, uint32_t num_workers, uint32_t worker_id, uint64_t seed);

// One summary per worker, each fed the stream generate_shard() would return for it
template <typename Summary, typename MakeFn>
std::vector<Summary> build_generated_shards(const std::string &generator, uint64_t total, uint32_t num_workers, uint64_t seed, MakeFn make) {
    return build_in_parallel<Summary>(num_workers, make, [&generator, total, num_workers, seed](Summary &summary, uint32_t id) {
        auto [begin, end] = shard_bounds(total, num_workers, id);
        if (begin == end) return;
        auto stream = make_generator(generator, end - begin, seed + id);
        while (!stream->done()) summary.update(stream->next());
    });
}

// Reduction order: sequential | tree | parallel_tree
void check_reduction(const std::string &reduction);

template <typename Summary> Summary reduce_summaries(std::vector<Summary> &&summaries, const std::string &reduction) {
    check_reduction(reduction);
    if (reduction == "sequential") return reduce_sequential(std::move(summaries));
    return reduce_tree(std::move(summaries), reduction == "parallel_tree");
}

// Accuracy calculation functions

// Largest distance between the requested rank and the true rank range of the returned
// value, over `num_queries` evenly spaced quantiles, normalized by n. `sorted` holds
// every observation the summary absorbed.
template <typename SummaryType> double calculate_max_rank_error(const SummaryType &summary, const std::vector<double> &sorted, uint32_t num_queries) {
    if (sorted.empty()) return 0.0;
    num_queries = std::max<uint32_t>(num_queries, 1);
    const uint64_t n = sorted.size();
    uint64_t worst = 0;
    for (uint32_t q = 0; q <= num_queries; ++q) {
        const double phi = static_cast<double>(q) / num_queries;
        const uint64_t target = quantile_to_rank(phi, n);
        const double value = summary.get_quantile(phi);
        const uint64_t lowest = static_cast<uint64_t>(std::lower_bound(sorted.begin(), sorted.end(), value) - sorted.begin()) + 1;
        const uint64_t highest = static_cast<uint64_t>(std::upper_bound(sorted.begin(), sorted.end(), value) - sorted.begin());
        uint64_t error = 0;
        if (target < lowest) {
            error = lowest - target;
        } else if (target > highest) {
            error = target - highest;
        }
        worst = std::max(worst, error);
    }
    return static_cast<double>(worst) / static_cast<double>(n);
}

// Median and the error bound the summary reports for it
inline std::pair<double, double> query_median(const GKSummary<double> &summary) { return summary.get_quantile_with_error(0.5); }
inline std::pair<double, double> query_median(const NaiveSummary<double> &summary) { return {summary.get_quantile(0.5), 0.0}; }
inline std::pair<double, double> query_median(const KLL &summary) { return {summary.get_quantile(0.5), summary.get_normalized_rank_error()}; }

inline uint64_t num_retained(const GKSummary<double> &summary) { return summary.get_num_retained(); }
inline uint64_t num_retained(const NaiveSummary<double> &summary) { return summary.get_n(); }
inline uint64_t num_retained(const KLL &summary) { return summary.get_num_retained(); }

// File utilities
void create_directory(const std::string &path);

// "output/run.json" -> "output/run_20240101_120000.json", local time
std::string timestamped_path(const std::string &path);

// ISO-8601 UTC time for result metadata
std::string utc_timestamp();

bool write_json(const std::string &filename, const json &j);
