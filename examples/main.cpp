#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Utils
#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

// Summary Headers
#include "parallel/summary_reducer.hpp"
#include "quantile_summary/gk_summary.hpp"
#include "quantile_summary/kll_datasketches.hpp"
#include "quantile_summary/naive_summary.hpp"

// Config Headers
#include "quantile_summary/quantile_summary_config.hpp"

// Common utilities
#include "common.hpp"

using namespace std;

// Median of a large generated stream, computed by `threads` workers whose summaries are merged.
// Every parameter can also be given through the environment: ALGORITHM=MODIFIED_GK VALUES=100000000 THREADS=8 EPSILON=0.01
struct BenchConfig {
    string algorithm;
    uint64_t values;
    uint32_t threads;
    string reduction;
    string generator;
    uint64_t seed;
    string output_file;

    static void add_params_to_config_parser(BenchConfig &config, ConfigParser &parser) {
        parser.AddParameter(new StringParameter("app.algorithm", "MODIFIED_GK", &config.algorithm, false,
                                                "Summary to run: NAIVE, GK (classical compression), MODIFIED_GK (modified compression) or KLL"));
        parser.AddParameter(new UnsignedInt64Parameter("app.values", "10000000", &config.values, false, "Total number of values, split across the threads"));
        parser.AddParameter(new UnsignedInt32Parameter("app.threads", "1", &config.threads, false, "Number of worker threads"));
        parser.AddParameter(new StringParameter("app.reduction", "sequential", &config.reduction, false, "Merge order: sequential, tree or parallel_tree"));
        parser.AddParameter(new StringParameter("app.generator", "random", &config.generator, false, "Data of each thread: random, ascending, descending or shuffled"));
        parser.AddParameter(new UnsignedInt64Parameter("app.seed", "0", &config.seed, false, "Seed of the first thread, thread i uses seed + i"));
        parser.AddParameter(new StringParameter("app.output_file", "", &config.output_file, false, "Optional JSON output path, a timestamp is appended"));
    }

    auto to_tuple() const {
        return std::make_tuple("algorithm", algorithm, "values", values, "threads", threads, "reduction", reduction, "generator", generator, "seed", seed);
    }

    friend std::ostream &operator<<(std::ostream &os, const BenchConfig &config) {
        ConfigPrinter<BenchConfig>::print(os, config);
        return os;
    }
};

struct BenchResult {
    double median;
    double reported_error;
    uint64_t count;
    uint64_t retained;
    uint64_t memory_bytes;
    double build_time_s;
    double merge_time_s;
    double query_time_s;
};

template <typename Summary, typename MakeFn> BenchResult run_bench(const BenchConfig &config, MakeFn make) {
    BenchResult result;
    Timer timer;

    timer.start();
    vector<Summary> shards = build_generated_shards<Summary>(config.generator, config.values, config.threads, config.seed, make);
    result.build_time_s = timer.stop_s();

    timer.start();
    Summary summary = reduce_summaries(std::move(shards), config.reduction);
    result.merge_time_s = timer.stop_s();

    timer.start();
    auto [median, error] = query_median(summary);
    result.query_time_s = timer.stop_s();

    result.median = median;
    result.reported_error = error;
    result.count = summary.get_n();
    result.retained = num_retained(summary);
    result.memory_bytes = summary.get_max_memory_usage();
    return result;
}

void export_to_json(const string &filename, const BenchConfig &config, const GKConfig &gk_config, const KLLConfig &kll_config, const BenchResult &result) {
    json j;
    j["metadata"] = {{"experiment_type", "quantile_bench"}, {"timestamp", utc_timestamp()}};
    j["config"]["experiment"] = {{"algorithm", config.algorithm}, {"values", config.values},       {"threads", config.threads},
                                 {"reduction", config.reduction}, {"generator", config.generator}, {"seed", config.seed}};
    j["config"]["gk"] = {{"epsilon", gk_config.epsilon}, {"strategy", gk_config.strategy}};
    j["config"]["kll"] = {{"k", kll_config.k}};
    j["results"] = {{"median", result.median},
                    {"reported_error", result.reported_error},
                    {"count", result.count},
                    {"retained", result.retained},
                    {"memory_bytes", result.memory_bytes},
                    {"build_time_s", result.build_time_s},
                    {"merge_time_s", result.merge_time_s},
                    {"query_time_s", result.query_time_s}};
    write_json(filename, j);
}

BenchResult run_algorithm(const BenchConfig &config, GKConfig &gk_config, const KLLConfig &kll_config) {
    if (config.algorithm == "NAIVE") return run_bench<NaiveSummary<double>>(config, []() { return NaiveSummary<double>(); });
    if (config.algorithm == "KLL") return run_bench<KLL>(config, [&kll_config]() { return KLL(kll_config); });
    if (config.algorithm == "GK" || config.algorithm == "MODIFIED_GK") {
        gk_config.strategy = config.algorithm == "GK" ? "CLASSICAL" : "MODIFIED";
        cout << gk_config << endl;
        return run_bench<GKSummary<double>>(config, [&gk_config]() { return GKSummary<double>(gk_config); });
    }
    throw ConfigurationError("Invalid choice of algorithm '" + config.algorithm + "', expected NAIVE, GK, MODIFIED_GK or KLL.");
}

int main(int argc, char **argv) {
    ConfigParser parser;
    BenchConfig config;
    GKConfig gk_config;
    KLLConfig kll_config;

    BenchConfig::add_params_to_config_parser(config, parser);
    GKConfig::add_params_to_config_parser(gk_config, parser);
    KLLConfig::add_params_to_config_parser(kll_config, parser);

    if (argc > 1 && (string(argv[1]) == "--help" || string(argv[1]) == "-h")) {
        parser.PrintUsage();
        return 0;
    }
    if (argc > 1 && string(argv[1]) == "--generate-doc") {
        parser.PrintMarkdown();
        return 0;
    }

    Status s = parser.ParseCommandLine(argc, argv);
    if (!s.IsOK()) {
        fprintf(stderr, "%s\n", s.ToString().c_str());
        return -1;
    }

    cout << config << endl;

    try {
        if (config.values == 0) { throw ConfigurationError("Need at least one value."); }
        check_reduction(config.reduction);

        BenchResult result = run_algorithm(config, gk_config, kll_config);

        cout << "Median: " << setprecision(10) << result.median << " (reported error " << setprecision(6) << result.reported_error << ")" << endl;
        cout << "Count: " << result.count << ", retained: " << result.retained << ", memory: " << result.memory_bytes / 1024 << " KB" << endl;
        cout << fixed << setprecision(4) << "Build: " << result.build_time_s << " s, merge: " << result.merge_time_s << " s, query: " << result.query_time_s << " s"
             << endl;

        if (!config.output_file.empty()) { export_to_json(timestamped_path(config.output_file), config, gk_config, kll_config, result); }
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
