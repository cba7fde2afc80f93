#pragma once

#include "property.hpp"
#include <string>

struct EdgeWeightConfig {
    std::string property_name;
    double default_weight = 1.0;
};

// Derives a positive weight for each edge from a configured property or the default
class EdgeWeightResolver {
public:
    // Throws ConfigError if default_weight is not a positive finite number
    explicit EdgeWeightResolver(EdgeWeightConfig config);

    // Throws ConfigError if default_weight is not a positive finite number
    static void validate(const EdgeWeightConfig& config);

    // Absent property -> default weight.
    // Non-numeric value -> ValueTypeError, non-positive or non-finite -> ValueRangeError.
    double weight(const Properties& edge_properties) const;

    const EdgeWeightConfig& config() const { return config_; }

private:
    EdgeWeightConfig config_;
};
