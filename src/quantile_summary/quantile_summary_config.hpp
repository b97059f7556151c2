#pragma once

#include "quantile_errors.hpp"
#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include <string>
#include <tuple>

enum class CompressionStrategy { CLASSICAL, MODIFIED };

inline CompressionStrategy parse_compression_strategy(const std::string &name) {
    if (name == "CLASSICAL") return CompressionStrategy::CLASSICAL;
    if (name == "MODIFIED") return CompressionStrategy::MODIFIED;
    throw ConfigurationError("Invalid compression strategy '" + name + "', expected CLASSICAL or MODIFIED.");
}

inline std::string to_string(CompressionStrategy strategy) { return strategy == CompressionStrategy::CLASSICAL ? "CLASSICAL" : "MODIFIED"; }

struct GKConfig
{
    double epsilon;
    std::string strategy;

    static void add_params_to_config_parser(GKConfig &gk_config, ConfigParser &parser)
    {
        parser.AddParameter(new DoubleParameter("gk.epsilon", "0.01", &gk_config.epsilon, false, "Maximum rank error as a fraction of the observation count, in (0, 1)"));
        parser.AddParameter(new StringParameter("gk.strategy", "MODIFIED", &gk_config.strategy, false, "Compression strategy: CLASSICAL or MODIFIED"));
    }

    CompressionStrategy get_strategy() const { return parse_compression_strategy(strategy); }

    auto to_tuple() const { return std::make_tuple("epsilon", epsilon, "strategy", strategy); }

    friend std::ostream &operator<<(std::ostream &os, const GKConfig &config)
    {
        ConfigPrinter<GKConfig>::print(os, config);
        return os;
    }
};

struct KLLConfig
{
    uint32_t k;

    static void add_params_to_config_parser(KLLConfig &kll_config, ConfigParser &parser)
    { parser.AddParameter(new UnsignedInt32Parameter("kll.k", "200", &kll_config.k, false, "K parameter for KLL sketch, controlling size and accuracy")); }

    auto to_tuple() const { return std::make_tuple("k", k); }

    friend std::ostream &operator<<(std::ostream &os, const KLLConfig &config)
    {
        ConfigPrinter<KLLConfig>::print(os, config);
        return os;
    }
};
