#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

// Library
#include "yaml-cpp/yaml.h"

// Utils
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

// One run of the plan. Unset fields are taken from the plan defaults.
struct RunConfig {
    string name;
    string algorithm;
    uint64_t values;
    uint32_t threads;
    double epsilon;
    uint32_t kll_k;
    string reduction;
    string generator;

    auto to_tuple() const {
        return std::make_tuple("algorithm", algorithm, "values", values, "threads", threads, "epsilon", epsilon, "kll_k", kll_k, "reduction", reduction, "generator",
                               generator);
    }
};

struct PlanConfig {
    string name;
    uint32_t repetitions;
    string output_file;
    uint64_t master_seed;

    // Exact rank errors need the whole stream in memory
    bool exact_error;
    uint32_t num_queries;

    vector<RunConfig> runs;
};

struct RunResult {
    string run_name;
    uint32_t repetition_id;
    double median;
    double reported_error;
    double max_rank_error;
    uint64_t count;
    uint64_t retained;
    uint64_t memory_bytes;
    double build_time_s;
    double merge_time_s;
};

RunConfig parse_run(const string &name, const YAML::Node &node, const RunConfig &defaults) {
    RunConfig run = defaults;
    run.name = name;
    if (node["algorithm"]) run.algorithm = node["algorithm"].as<string>();
    if (node["values"]) run.values = node["values"].as<uint64_t>();
    if (node["threads"]) run.threads = node["threads"].as<uint32_t>();
    if (node["epsilon"]) run.epsilon = node["epsilon"].as<double>();
    if (node["kll_k"]) run.kll_k = node["kll_k"].as<uint32_t>();
    if (node["reduction"]) run.reduction = node["reduction"].as<string>();
    if (node["generator"]) run.generator = node["generator"].as<string>();
    return run;
}

PlanConfig parse_yaml(const string &yaml_file) {
    YAML::Node root = YAML::LoadFile(yaml_file);
    PlanConfig config;

    // Parse metadata
    auto metadata = root["metadata"];
    config.name = metadata["name"].as<string>();
    config.repetitions = metadata["repetitions"].as<uint32_t>();
    config.output_file = metadata["output_file"].as<string>();
    config.master_seed = metadata["master_seed"] ? metadata["master_seed"].as<uint64_t>() : 0;

    // Parse evaluation settings
    auto eval_node = root["evaluation"];
    config.exact_error = eval_node && eval_node["exact_error"] ? eval_node["exact_error"].as<bool>() : false;
    config.num_queries = eval_node && eval_node["num_queries"] ? eval_node["num_queries"].as<uint32_t>() : 100;

    RunConfig defaults{"", "MODIFIED_GK", 1000000, 1, 0.01, 200, "sequential", "random"};
    if (root["defaults"]) defaults = parse_run("", root["defaults"], defaults);

    // Runs keep the order of the file
    auto runs_node = root["runs"];
    if (!runs_node || runs_node.size() == 0) { throw ConfigurationError("Plan '" + config.name + "' has no runs."); }
    for (auto it = runs_node.begin(); it != runs_node.end(); ++it) { config.runs.push_back(parse_run(it->first.as<string>(), it->second, defaults)); }

    return config;
}

template <typename Summary, typename MakeFn> RunResult execute_run(const RunConfig &run, uint64_t seed, const PlanConfig &plan, MakeFn make) {
    RunResult result;
    result.run_name = run.name;
    Timer timer;

    timer.start();
    vector<Summary> shards = build_generated_shards<Summary>(run.generator, run.values, run.threads, seed, make);
    result.build_time_s = timer.stop_s();

    timer.start();
    Summary summary = reduce_summaries(std::move(shards), run.reduction);
    result.merge_time_s = timer.stop_s();

    auto [median, error] = query_median(summary);
    result.median = median;
    result.reported_error = error;
    result.count = summary.get_n();
    result.retained = num_retained(summary);
    result.memory_bytes = summary.get_max_memory_usage();

    result.max_rank_error = -1.0;
    if (plan.exact_error) {
        // Same streams the workers consumed
        vector<double> sorted;
        sorted.reserve(run.values);
        for (uint32_t id = 0; id < run.threads; ++id) {
            vector<double> shard = generate_shard(run.generator, run.values, run.threads, id, seed);
            sorted.insert(sorted.end(), shard.begin(), shard.end());
        }
        sort(sorted.begin(), sorted.end());
        result.max_rank_error = calculate_max_rank_error(summary, sorted, plan.num_queries);
    }
    return result;
}

RunResult execute_run(const RunConfig &run, uint64_t seed, const PlanConfig &plan) {
    if (run.values == 0) { throw ConfigurationError("Run '" + run.name + "' needs at least one value."); }
    check_reduction(run.reduction);

    if (run.algorithm == "NAIVE") return execute_run<NaiveSummary<double>>(run, seed, plan, []() { return NaiveSummary<double>(); });
    if (run.algorithm == "KLL") {
        KLLConfig kll_config{run.kll_k};
        return execute_run<KLL>(run, seed, plan, [kll_config]() { return KLL(kll_config); });
    }
    if (run.algorithm == "GK" || run.algorithm == "MODIFIED_GK") {
        GKConfig gk_config{run.epsilon, run.algorithm == "GK" ? "CLASSICAL" : "MODIFIED"};
        return execute_run<GKSummary<double>>(run, seed, plan, [gk_config]() { return GKSummary<double>(gk_config); });
    }
    throw ConfigurationError("Run '" + run.name + "' has an invalid algorithm '" + run.algorithm + "'.");
}

void export_to_json(const string &filename, const PlanConfig &config, const vector<RunResult> &results) {
    json j;

    j["metadata"] = {{"experiment_type", "plan"}, {"name", config.name}, {"timestamp", utc_timestamp()}};

    j["config"]["plan"] = {{"repetitions", config.repetitions},
                           {"master_seed", config.master_seed},
                           {"exact_error", config.exact_error},
                           {"num_queries", config.num_queries}};
    j["config"]["runs"] = json::object();
    for (const auto &run : config.runs) {
        j["config"]["runs"][run.name] = {{"algorithm", run.algorithm}, {"values", run.values},       {"threads", run.threads},
                                         {"epsilon", run.epsilon},     {"kll_k", run.kll_k},         {"reduction", run.reduction},
                                         {"generator", run.generator}};
    }

    j["results"] = json::array();
    for (const auto &r : results) {
        json run_json = {{"run", r.run_name},
                         {"repetition_id", r.repetition_id},
                         {"median", r.median},
                         {"reported_error", r.reported_error},
                         {"count", r.count},
                         {"retained", r.retained},
                         {"memory_bytes", r.memory_bytes},
                         {"build_time_s", r.build_time_s},
                         {"merge_time_s", r.merge_time_s}};
        if (r.max_rank_error >= 0.0) run_json["max_rank_error"] = r.max_rank_error;
        j["results"].push_back(run_json);
    }

    write_json(filename, j);
}

void run_plan(const PlanConfig &config) {
    cout << "Plan: " << config.name << " (" << config.runs.size() << " runs, " << config.repetitions << " repetitions)" << endl;

    vector<RunResult> all_results;
    for (uint32_t rep = 0; rep < config.repetitions; ++rep) {
        cout << "\n=== Repetition " << (rep + 1) << "/" << config.repetitions << " ===" << endl;

        for (size_t i = 0; i < config.runs.size(); ++i) {
            const RunConfig &run = config.runs[i];
            const uint64_t seed = config.master_seed + (static_cast<uint64_t>(rep) * config.runs.size() + i) * run.threads;
            cout << "\n[" << run.name << "] " << ConfigPrinter<RunConfig>::to_line(run) << endl;

            RunResult result = execute_run(run, seed, config);
            result.repetition_id = rep;

            cout << "  median=" << setprecision(10) << result.median << setprecision(6) << " reported_error=" << result.reported_error;
            if (result.max_rank_error >= 0.0) cout << " max_rank_error=" << result.max_rank_error;
            cout << " retained=" << result.retained << " build=" << result.build_time_s << " s merge=" << result.merge_time_s << " s" << endl;

            all_results.push_back(result);
        }
    }

    export_to_json(timestamped_path(config.output_file), config, all_results);
}

int main(int argc, char **argv) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <yaml_file>" << endl;
        return 1;
    }

    string yaml_file = argv[1];

    try {
        PlanConfig config = parse_yaml(yaml_file);
        run_plan(config);
    } catch (const YAML::Exception &e) {
        cerr << "YAML parsing error: " << e.what() << endl;
        return 1;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
