#pragma once

#include "quantile_summary/quantile_errors.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <future>
#include <utility>
#include <vector>

// [begin, end) slice of [0, total) owned by worker `worker_id`. Slices are contiguous,
// disjoint and cover the whole range; the first total % num_workers workers get one more.
inline std::pair<uint64_t, uint64_t> shard_bounds(uint64_t total, uint32_t num_workers, uint32_t worker_id) {
    if (num_workers == 0) { throw ConfigurationError("Number of workers must be positive."); }
    if (worker_id >= num_workers) { throw ConfigurationError("Worker id out of range."); }

    const uint64_t base = total / num_workers;
    const uint64_t extra = total % num_workers;
    const uint64_t begin = worker_id * base + std::min<uint64_t>(worker_id, extra);
    const uint64_t end = begin + base + (worker_id < extra ? 1 : 0);
    return {begin, end};
}

// Runs one task per worker. Each task creates its own summary with make() and fills it
// through feed(summary, worker_id); no state is shared between workers. An exception
// thrown by any worker is rethrown here once all workers have been joined.
template <typename Summary, typename MakeFn, typename FeedFn>
std::vector<Summary> build_in_parallel(uint32_t num_workers, MakeFn make, FeedFn feed) {
    if (num_workers == 0) { throw ConfigurationError("Number of workers must be positive."); }

    std::vector<std::future<Summary>> futures;
    futures.reserve(num_workers);
    for (uint32_t id = 0; id < num_workers; ++id) {
        futures.push_back(std::async(std::launch::async, [&make, &feed, id]() {
            Summary summary = make();
            feed(summary, id);
            return summary;
        }));
    }

    // Wait for everyone before rethrowing so no task outlives make/feed
    for (auto &future : futures) future.wait();

    std::vector<Summary> summaries;
    summaries.reserve(num_workers);
    for (auto &future : futures) summaries.push_back(future.get());
    return summaries;
}

// Builds one summary per slice of `values`
template <typename Summary, typename T, typename MakeFn>
std::vector<Summary> summarize_in_parallel(const std::vector<T> &values, uint32_t num_workers, MakeFn make) {
    return build_in_parallel<Summary>(num_workers, make, [&values, num_workers](Summary &summary, uint32_t id) {
        auto [begin, end] = shard_bounds(values.size(), num_workers, id);
        for (uint64_t i = begin; i < end; ++i) summary.update(values[i]);
    });
}

// ((s0 + s1) + s2) + ...
template <typename Summary> Summary reduce_sequential(std::vector<Summary> &&summaries) {
    if (summaries.empty()) { throw ConfigurationError("Cannot reduce an empty set of summaries."); }

    Summary result = std::move(summaries.front());
    for (size_t i = 1; i < summaries.size(); ++i) result.merge(std::move(summaries[i]));
    summaries.clear();
    return result;
}

// Balanced pairwise reduction: (s0 + s1) + (s2 + s3) + ... level by level. With
// `parallel`, the merges of one level run concurrently.
template <typename Summary> Summary reduce_tree(std::vector<Summary> &&summaries, bool parallel = false) {
    if (summaries.empty()) { throw ConfigurationError("Cannot reduce an empty set of summaries."); }

    std::vector<Summary> level = std::move(summaries);
    summaries.clear();
    while (level.size() > 1) {
        const size_t num_pairs = level.size() / 2;
        if (parallel) {
            std::vector<std::future<void>> futures;
            futures.reserve(num_pairs);
            for (size_t i = 0; i < num_pairs; ++i) {
                futures.push_back(std::async(std::launch::async, [&level, i]() { level[2 * i].merge(std::move(level[2 * i + 1])); }));
            }
            for (auto &future : futures) future.wait();
            for (auto &future : futures) future.get();
        } else {
            for (size_t i = 0; i < num_pairs; ++i) level[2 * i].merge(std::move(level[2 * i + 1]));
        }

        std::vector<Summary> next;
        next.reserve(num_pairs + 1);
        for (size_t i = 0; i < num_pairs; ++i) next.push_back(std::move(level[2 * i]));
        if (level.size() % 2 == 1) next.push_back(std::move(level.back()));
        level = std::move(next);
    }
    return std::move(level.front());
}
