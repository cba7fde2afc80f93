#include "edge_weight.hpp"
#include "errors.hpp"
#include "options.hpp"
#include <cmath>
#include <sstream>
#include <utility>

EdgeWeightResolver::EdgeWeightResolver(EdgeWeightConfig config)
    : config_(std::move(config)) {
    validate(config_);
}

void EdgeWeightResolver::validate(const EdgeWeightConfig& config) {
    if (!(config.default_weight > 0) || !std::isfinite(config.default_weight)) {
        std::ostringstream message;
        message << "The param '" << OPTION_DEFAULT_WEIGHT
                << "' must be greater than 0, actual got '" << config.default_weight << "'";
        throw ConfigError(message.str());
    }
}

double EdgeWeightResolver::weight(const Properties& edge_properties) const {
    if (config_.property_name.empty()) {
        return config_.default_weight;
    }

    auto it = edge_properties.find(config_.property_name);
    if (it == edge_properties.end()) {
        return config_.default_weight;
    }

    const PropertyValue& property = it->second;
    if (!is_numeric(property)) {
        throw ValueTypeError("The value of " + config_.property_name +
                             " must be a numeric value, actual got '" +
                             property_to_string(property) + "'");
    }

    double weight = numeric_value(property);
    if (!(weight > 0) || !std::isfinite(weight)) {
        throw ValueRangeError("The value of " + config_.property_name +
                              " must be greater than 0, actual got '" +
                              property_to_string(property) + "'");
    }
    return weight;
}
