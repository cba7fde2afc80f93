#pragma once

#include "config.hpp"
#include "edge_weight.hpp"
#include "target_spec.hpp"
#include <string>

constexpr const char* OPTION_SOURCE_ID = "source_id";
constexpr const char* OPTION_TARGET_ID = "target_id";
constexpr const char* OPTION_WEIGHT_PROPERTY = "weight_property";
constexpr const char* OPTION_DEFAULT_WEIGHT = "default_weight";
constexpr const char* OPTION_INPUT = "input";
constexpr const char* OPTION_OUTPUT = "output";
constexpr const char* OPTION_EDGE_DIRECTION = "edge_direction";
constexpr const char* OPTION_PARTITIONER = "partitioner";
constexpr const char* OPTION_MAX_SUPERSTEPS = "max_supersteps";
constexpr const char* OPTION_HALT_ON_TARGETS_REACHED = "halt_on_targets_reached";
constexpr const char* OPTION_OMP_THREADS = "omp_threads";
constexpr const char* OPTION_STATS_OUTPUT = "stats_output";
constexpr const char* OPTION_VERBOSE = "verbose";

enum class PartitionerType {
    METIS,
    HASH
};

// Validated job options, built once before superstep 0
struct ShortestPathOptions {
    TargetSpec target_spec;
    EdgeWeightConfig weight;

    std::string input;
    std::string output = "shortest_paths.json";
    bool both_directions = false;
    PartitionerType partitioner = PartitionerType::METIS;
    int max_supersteps = 10000;
    bool halt_on_targets_reached = false;
    int omp_threads = 0;  // 0 keeps the OpenMP default
    std::string stats_output;
    bool verbose = false;

    // Throws ConfigError on any missing, blank or out-of-range option
    static ShortestPathOptions from_config(const Config& config);
};
