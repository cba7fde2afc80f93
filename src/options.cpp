#include "options.hpp"
#include "errors.hpp"

ShortestPathOptions ShortestPathOptions::from_config(const Config& config) {
    ShortestPathOptions options;

    options.target_spec = parse_target_spec(config.get_string(OPTION_SOURCE_ID, ""),
                                            config.get_string(OPTION_TARGET_ID, ""));

    options.weight.property_name = trim(config.get_string(OPTION_WEIGHT_PROPERTY, ""));
    options.weight.default_weight = config.get_double(OPTION_DEFAULT_WEIGHT, 1.0);
    EdgeWeightResolver::validate(options.weight);

    options.input = config.get_string(OPTION_INPUT, "");
    options.output = config.get_string(OPTION_OUTPUT, options.output);

    std::string direction = config.get_string(OPTION_EDGE_DIRECTION, "out");
    if (direction == "out") {
        options.both_directions = false;
    } else if (direction == "both") {
        options.both_directions = true;
    } else {
        throw ConfigError(std::string("The param '") + OPTION_EDGE_DIRECTION +
                          "' must be 'out' or 'both', actual got '" + direction + "'");
    }

    std::string partitioner = config.get_string(OPTION_PARTITIONER, "metis");
    if (partitioner == "metis") {
        options.partitioner = PartitionerType::METIS;
    } else if (partitioner == "hash") {
        options.partitioner = PartitionerType::HASH;
    } else {
        throw ConfigError(std::string("The param '") + OPTION_PARTITIONER +
                          "' must be 'metis' or 'hash', actual got '" + partitioner + "'");
    }

    options.max_supersteps = config.get_int(OPTION_MAX_SUPERSTEPS, options.max_supersteps);
    if (options.max_supersteps <= 0) {
        throw ConfigError(std::string("The param '") + OPTION_MAX_SUPERSTEPS +
                          "' must be greater than 0");
    }

    options.halt_on_targets_reached = config.get_bool(OPTION_HALT_ON_TARGETS_REACHED, false);

    options.omp_threads = config.get_int(OPTION_OMP_THREADS, 0);
    if (options.omp_threads < 0) {
        throw ConfigError(std::string("The param '") + OPTION_OMP_THREADS +
                          "' must not be negative");
    }

    options.stats_output = config.get_string(OPTION_STATS_OUTPUT, "");
    options.verbose = config.get_bool(OPTION_VERBOSE, false);
    return options;
}
