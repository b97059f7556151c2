#include "common.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>

std::unique_ptr<QuantileGenerator> make_generator(const std::string &generator, uint64_t num, uint64_t seed)
{
    if (generator == "random") return std::make_unique<RandomGenerator>(0.5, DATASET_CENTER, num, seed);
    if (generator == "ascending") return std::make_unique<SequentialGenerator>(0.5, DATASET_CENTER, num, SequentialOrder::ASCENDING);
    if (generator == "descending") return std::make_unique<SequentialGenerator>(0.5, DATASET_CENTER, num, SequentialOrder::DESCENDING);
    if (generator == "shuffled") return std::make_unique<ShuffledGenerator>(0.5, DATASET_CENTER, num, seed);
    throw ConfigurationError("Unknown generator '" + generator + "', expected random, ascending, descending or shuffled.");
}

std::vector<double> generate_dataset(const std::string &generator, uint64_t num, uint64_t seed)
{
    return make_generator(generator, num, seed)->generate_all();
}

std::vector<double> generate_shard(const std::string &generator, uint64_t total, uint32_t num_workers, uint32_t worker_id, uint64_t seed)
{
    auto [begin, end] = shard_bounds(total, num_workers, worker_id);
    if (begin == end) return {};
    return generate_dataset(generator, end - begin, seed + worker_id);
}

void check_reduction(const std::string &reduction)
{
    if (reduction != "sequential" && reduction != "tree" && reduction != "parallel_tree")
    {
        throw ConfigurationError("Unknown reduction '" + reduction + "', expected sequential, tree or parallel_tree.");
    }
}

void create_directory(const std::string &path)
{
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos)
    {
        std::string dir = path.substr(0, pos);
        mkdir(dir.c_str(), 0755);
    }
}

std::string timestamped_path(const std::string &path)
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream timestamp_stream;
    timestamp_stream << std::put_time(&tm_now, "%Y%m%d_%H%M%S");
    std::string timestamp = timestamp_stream.str();

    // Insert timestamp before file extension
    size_t ext_pos = path.find_last_of('.');
    size_t dir_pos = path.find_last_of('/');
    if (ext_pos != std::string::npos && (dir_pos == std::string::npos || ext_pos > dir_pos))
    {
        return path.substr(0, ext_pos) + "_" + timestamp + path.substr(ext_pos);
    }
    return path + "_" + timestamp;
}

std::string utc_timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
    gmtime_r(&now_time_t, &tm_now);
    std::ostringstream timestamp;
    timestamp << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%SZ");
    return timestamp.str();
}

bool write_json(const std::string &filename, const json &j)
{
    create_directory(filename);
    std::ofstream out(filename);
    if (!out.is_open())
    {
        std::cerr << "Error: Cannot open output file: " << filename << std::endl;
        return false;
    }
    out << j.dump(2);
    out.close();
    std::cout << "\nResults exported to: " << filename << std::endl;
    return true;
}
