#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

// Typed edge/vertex property value
using PropertyValue = std::variant<int64_t, double, bool, std::string>;

using Properties = std::unordered_map<std::string, PropertyValue>;

// Parse an input literal: integer, floating point, true/false, "quoted" or bare string
PropertyValue parse_property_value(const std::string& literal);

bool is_numeric(const PropertyValue& value);

// Numeric value as double; only valid when is_numeric() holds
double numeric_value(const PropertyValue& value);

std::string property_to_string(const PropertyValue& value);
