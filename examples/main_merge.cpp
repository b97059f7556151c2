#include <algorithm>
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

// Config Headers
#include "quantile_summary/quantile_summary_config.hpp"

// Common utilities
#include "common.hpp"

using namespace std;

// Merge Experiment Config
struct MergeConfig {
    uint64_t values;
    uint32_t threads;
    uint32_t repetitions;
    string generator;
    string strategies;
    uint32_t num_queries;
    uint64_t seed;
    string output_file;

    static void add_params_to_config_parser(MergeConfig &config, ConfigParser &parser) {
        parser.AddParameter(new UnsignedInt64Parameter("app.values", "1000000", &config.values, false, "Total stream size, split across the shards"));
        parser.AddParameter(new UnsignedInt32Parameter("app.threads", "8", &config.threads, false, "Number of shards, each summarized by its own thread"));
        parser.AddParameter(new UnsignedInt32Parameter("app.repetitions", "3", &config.repetitions, false, "Number of experiment repetitions"));
        parser.AddParameter(new StringParameter("app.generator", "random", &config.generator, false, "Data of each shard: random, ascending, descending or shuffled"));
        parser.AddParameter(new StringParameter("app.strategies", "CLASSICAL,MODIFIED", &config.strategies, false, "Comma separated compression strategies to compare"));
        parser.AddParameter(new UnsignedInt32Parameter("app.num_queries", "1000", &config.num_queries, false, "Evenly spaced quantiles checked against the exact ranks"));
        parser.AddParameter(new UnsignedInt64Parameter("app.seed", "1", &config.seed, false, "Base seed of the generated shards"));
        parser.AddParameter(new StringParameter("app.output_file", "output/merge_results.json", &config.output_file, false, "Output JSON file path"));
    }

    auto to_tuple() const {
        return std::make_tuple("values", values, "threads", threads, "repetitions", repetitions, "generator", generator, "strategies", strategies, "num_queries",
                               num_queries, "seed", seed, "output_file", output_file);
    }

    friend std::ostream &operator<<(std::ostream &os, const MergeConfig &config) {
        ConfigPrinter<MergeConfig>::print(os, config);
        return os;
    }
};

// One reduced summary
struct MergeResult {
    uint32_t repetition_id;
    string strategy;
    string reduction;
    uint64_t count;
    uint64_t retained;
    uint64_t memory_bytes;
    double merge_time_s;
    double reported_error;
    double max_rank_error;
};

// Shard summaries of one repetition and strategy
struct ShardStats {
    double build_time_s;
    uint64_t retained;
    double max_rank_error;
};

vector<string> split_list(const string &list) {
    vector<string> items;
    stringstream ss(list);
    string item;
    while (getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

void export_to_json(const string &filename, const MergeConfig &config, double epsilon, const vector<ShardStats> &shards, const vector<MergeResult> &results) {
    json j;

    // Metadata section
    j["metadata"] = {{"experiment_type", "merge"}, {"timestamp", utc_timestamp()}};

    // Config section
    j["config"]["experiment"] = {{"values", config.values},         {"threads", config.threads},         {"repetitions", config.repetitions},
                                 {"generator", config.generator}, {"num_queries", config.num_queries}, {"seed", config.seed}};
    j["config"]["gk"] = {{"epsilon", epsilon}, {"strategies", split_list(config.strategies)}};

    // Results section
    j["shards"] = json::array();
    for (const auto &s : shards) {
        j["shards"].push_back({{"build_time_s", s.build_time_s}, {"retained", s.retained}, {"max_rank_error", s.max_rank_error}});
    }

    j["results"] = json::array();
    for (const auto &r : results) {
        j["results"].push_back({{"repetition_id", r.repetition_id},
                                {"strategy", r.strategy},
                                {"reduction", r.reduction},
                                {"count", r.count},
                                {"retained", r.retained},
                                {"memory_bytes", r.memory_bytes},
                                {"merge_time_s", r.merge_time_s},
                                {"reported_error", r.reported_error},
                                {"max_rank_error", r.max_rank_error}});
    }

    write_json(filename, j);
}

void run_merge_experiment(const MergeConfig &config, const GKConfig &gk_config) {
    cout << config << endl;

    const vector<string> strategies = split_list(config.strategies);
    if (strategies.empty()) { throw ConfigurationError("No compression strategy given."); }
    for (const auto &name : strategies) parse_compression_strategy(name);

    const vector<string> reductions = {"sequential", "tree", "parallel_tree"};

    vector<ShardStats> all_shards;
    vector<MergeResult> all_results;

    for (uint32_t rep = 0; rep < config.repetitions; ++rep) {
        cout << "\n=== Repetition " << (rep + 1) << "/" << config.repetitions << " ===" << endl;

        // Each shard gets its own seed; the exact answer comes from the concatenation
        const uint64_t rep_seed = config.seed + static_cast<uint64_t>(rep) * config.threads;
        vector<vector<double>> shard_data(config.threads);
        vector<double> sorted;
        sorted.reserve(config.values);
        for (uint32_t id = 0; id < config.threads; ++id) {
            shard_data[id] = generate_shard(config.generator, config.values, config.threads, id, rep_seed);
            sorted.insert(sorted.end(), shard_data[id].begin(), shard_data[id].end());
        }
        sort(sorted.begin(), sorted.end());
        cout << "Generated " << sorted.size() << " values in " << config.threads << " shards (" << config.generator << ")" << endl;

        for (const auto &strategy_name : strategies) {
            GKConfig strategy_config = gk_config;
            strategy_config.strategy = strategy_name;
            cout << "\n" << ConfigPrinter<GKConfig>::to_line(strategy_config) << endl;

            Timer timer;
            timer.start();
            vector<GKSummary<double>> shards = build_in_parallel<GKSummary<double>>(
                config.threads, [&strategy_config]() { return GKSummary<double>(strategy_config); },
                [&shard_data](GKSummary<double> &summary, uint32_t id) { summary.update(shard_data[id].begin(), shard_data[id].end()); });
            const double build_time_s = timer.stop_s();

            for (uint32_t id = 0; id < config.threads; ++id) {
                vector<double> shard_sorted = shard_data[id];
                sort(shard_sorted.begin(), shard_sorted.end());
                ShardStats stats;
                stats.build_time_s = build_time_s;
                stats.retained = shards[id].get_num_retained();
                stats.max_rank_error = shards[id].is_empty() ? 0.0 : calculate_max_rank_error(shards[id], shard_sorted, config.num_queries);
                all_shards.push_back(stats);
            }
            cout << "  Shards built in " << build_time_s << " s" << endl;

            for (const auto &reduction : reductions) {
                vector<GKSummary<double>> copies = shards;

                MergeResult result;
                result.repetition_id = rep;
                result.strategy = strategy_name;
                result.reduction = reduction;

                timer.start();
                GKSummary<double> merged = reduce_summaries(std::move(copies), reduction);
                result.merge_time_s = timer.stop_s();

                result.count = merged.get_n();
                result.retained = merged.get_num_retained();
                result.memory_bytes = merged.get_max_memory_usage();
                result.reported_error = merged.get_quantile_with_error(0.5).second;
                result.max_rank_error = calculate_max_rank_error(merged, sorted, config.num_queries);

                cout << "  " << left << setw(14) << reduction << right << " retained=" << setw(8) << result.retained << " max_rank_error=" << setw(10)
                     << result.max_rank_error << " merge=" << result.merge_time_s << " s" << endl;
                if (result.max_rank_error > gk_config.epsilon) { cerr << "Warning: rank error above epsilon for " << strategy_name << "/" << reduction << endl; }

                all_results.push_back(result);
            }
        }
    }

    export_to_json(timestamped_path(config.output_file), config, gk_config.epsilon, all_shards, all_results);
}

int main(int argc, char **argv) {
    ConfigParser parser;
    MergeConfig merge_config;
    GKConfig gk_config;

    MergeConfig::add_params_to_config_parser(merge_config, parser);
    // Strategies come from app.strategies
    parser.AddParameter(new DoubleParameter("gk.epsilon", "0.01", &gk_config.epsilon, false, "Maximum rank error as a fraction of the observation count, in (0, 1)"));

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

    try {
        if (merge_config.values == 0) { throw ConfigurationError("Need at least one value."); }
        run_merge_experiment(merge_config, gk_config);
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
