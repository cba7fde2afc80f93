#include "property.hpp"
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

PropertyValue parse_property_value(const std::string& literal) {
    if (literal.size() >= 2 && literal.front() == '"' && literal.back() == '"') {
        return literal.substr(1, literal.size() - 2);
    }
    if (literal == "true") {
        return true;
    }
    if (literal == "false") {
        return false;
    }
    if (!literal.empty()) {
        const char* begin = literal.c_str();
        char* end = nullptr;

        errno = 0;
        long long as_long = std::strtoll(begin, &end, 10);
        if (errno == 0 && end == begin + literal.size()) {
            return static_cast<int64_t>(as_long);
        }

        errno = 0;
        double as_double = std::strtod(begin, &end);
        if (errno == 0 && end == begin + literal.size()) {
            return as_double;
        }
    }
    return literal;
}

bool is_numeric(const PropertyValue& value) {
    return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
}

double numeric_value(const PropertyValue& value) {
    if (const auto* as_long = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*as_long);
    }
    if (const auto* as_double = std::get_if<double>(&value)) {
        return *as_double;
    }
    throw std::invalid_argument("Property value is not numeric");
}

std::string property_to_string(const PropertyValue& value) {
    if (const auto* as_long = std::get_if<int64_t>(&value)) {
        return std::to_string(*as_long);
    }
    if (const auto* as_double = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *as_double;
        return out.str();
    }
    if (const auto* as_bool = std::get_if<bool>(&value)) {
        return *as_bool ? "true" : "false";
    }
    return std::get<std::string>(value);
}
