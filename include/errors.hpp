#pragma once

#include <stdexcept>
#include <string>

// Base for every fatal failure raised by the shortest path job
class ComputerError : public std::runtime_error {
public:
    explicit ComputerError(const std::string& message) : std::runtime_error(message) {}
};

// Blank, malformed or out-of-range option
class ConfigError : public ComputerError {
public:
    explicit ConfigError(const std::string& message) : ComputerError(message) {}
};

// Edge weight property holds a non-numeric value
class ValueTypeError : public ComputerError {
public:
    explicit ValueTypeError(const std::string& message) : ComputerError(message) {}
};

// Edge weight is numeric but not a positive finite number
class ValueRangeError : public ComputerError {
public:
    explicit ValueRangeError(const std::string& message) : ComputerError(message) {}
};

// Malformed line in a graph input file
class GraphFormatError : public ComputerError {
public:
    explicit GraphFormatError(const std::string& message) : ComputerError(message) {}
};
