/**
 * Compression Benchmark for GK summaries
 * Measures retained entries, number of full compressions and realized rank error
 * of both compression strategies on ascending, descending, shuffled and random streams
 * Test:  ./build/bin/compression_benchmark --items 1000000 --epsilon 0.001
 */

#include "generator/quantile_generator.hpp"
#include "quantile_summary/gk_summary.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <vector>

using json = nlohmann::json;

struct CompressionResult
{
    uint64_t retained;
    uint64_t peak_retained;
    uint32_t compressions;
    double insert_time_s;
    double max_rank_error;
};

std::unique_ptr<QuantileGenerator> make_stream(const std::string &order, uint64_t num_items, uint64_t seed)
{
    if (order == "ascending") return std::make_unique<SequentialGenerator>(0.5, 0.0, num_items, SequentialOrder::ASCENDING);
    if (order == "descending") return std::make_unique<SequentialGenerator>(0.5, 0.0, num_items, SequentialOrder::DESCENDING);
    if (order == "shuffled") return std::make_unique<ShuffledGenerator>(0.5, 0.0, num_items, seed);
    return std::make_unique<RandomGenerator>(0.5, 0.0, num_items, seed);
}

// Worst distance between requested and true rank over `num_queries` + 1 evenly spaced quantiles
double max_rank_error(const GKSummary<double> &summary, const std::vector<double> &sorted, uint32_t num_queries)
{
    const uint64_t n = sorted.size();
    uint64_t worst = 0;
    for (uint32_t q = 0; q <= num_queries; ++q)
    {
        const double phi = static_cast<double>(q) / num_queries;
        const uint64_t target = quantile_to_rank(phi, n);
        const double value = summary.get_quantile(phi);
        const uint64_t lowest = std::lower_bound(sorted.begin(), sorted.end(), value) - sorted.begin() + 1;
        const uint64_t highest = std::upper_bound(sorted.begin(), sorted.end(), value) - sorted.begin();
        if (target < lowest) worst = std::max(worst, lowest - target);
        if (target > highest) worst = std::max(worst, target - highest);
    }
    return static_cast<double>(worst) / n;
}

CompressionResult measure_compression(CompressionStrategy strategy, double epsilon, const std::vector<double> &stream, const std::vector<double> &sorted)
{
    CompressionResult result;
    GKSummary<double> summary(epsilon, strategy);
    result.peak_retained = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (double value : stream)
    {
        summary.update(value);
        result.peak_retained = std::max<uint64_t>(result.peak_retained, summary.get_num_retained());
    }
    result.insert_time_s = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();

    result.retained = summary.get_num_retained();
    result.compressions = summary.get_num_compressions();
    result.max_rank_error = max_rank_error(summary, sorted, 1000);
    return result;
}

int main(int argc, char *argv[])
{
    std::cout << "GK Compression Benchmark\n" << std::string(80, '=') << std::endl;

    uint64_t num_items = 1000000;
    double epsilon = 0.001;
    uint64_t seed = 1;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--items" && i + 1 < argc) { num_items = std::stoull(argv[++i]); }
        else if (arg == "--epsilon" && i + 1 < argc) { epsilon = std::stod(argv[++i]); }
        else if (arg == "--seed" && i + 1 < argc) { seed = std::stoull(argv[++i]); }
        else if (arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --items N     Number of values per stream (default: 1000000)\n"
                      << "  --epsilon E   Maximum rank error (default: 0.001)\n"
                      << "  --seed N      Seed of the shuffled and random streams (default: 1)\n";
            return 0;
        }
    }

    if (num_items == 0)
    {
        std::cerr << "Error: --items must be positive" << std::endl;
        return 1;
    }

    std::cout << "Config: items=" << num_items << ", epsilon=" << epsilon << ", 1/eps=" << std::fixed << std::setprecision(0) << 1.0 / epsilon << "\n" << std::endl;

    const std::vector<std::string> orders = {"ascending", "descending", "shuffled", "random"};
    const std::vector<CompressionStrategy> strategies = {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED};

    json results;
    results["config"] = {{"num_items", num_items}, {"epsilon", epsilon}, {"seed", seed}};
    results["results"] = json::array();

    std::cout << std::left << std::setw(12) << "order" << std::setw(11) << "strategy" << std::right << std::setw(10) << "retained" << std::setw(10) << "peak"
              << std::setw(14) << "compressions" << std::setw(12) << "insert_s" << std::setw(14) << "rank_error" << std::endl;

    try
    {
        for (const auto &order : orders)
        {
            std::vector<double> stream = make_stream(order, num_items, seed)->generate_all();
            std::vector<double> sorted = stream;
            std::sort(sorted.begin(), sorted.end());

            for (CompressionStrategy strategy : strategies)
            {
                CompressionResult r = measure_compression(strategy, epsilon, stream, sorted);
                std::cout << std::left << std::setw(12) << order << std::setw(11) << to_string(strategy) << std::right << std::setw(10) << r.retained << std::setw(10)
                          << r.peak_retained << std::setw(14) << r.compressions << std::setw(12) << std::setprecision(4) << r.insert_time_s << std::setw(14)
                          << std::setprecision(6) << r.max_rank_error << std::endl;

                results["results"].push_back({{"order", order},
                                              {"strategy", to_string(strategy)},
                                              {"retained", r.retained},
                                              {"peak_retained", r.peak_retained},
                                              {"compressions", r.compressions},
                                              {"insert_time_s", r.insert_time_s},
                                              {"max_rank_error", r.max_rank_error}});
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    mkdir("output", 0755);
    std::ofstream out("output/compression_results.json");
    if (out)
    {
        out << results.dump(2);
        std::cout << "\nSaved: output/compression_results.json" << std::endl;
    }

    return 0;
}
