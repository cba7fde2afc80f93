#pragma once

#include <cstdint>
#include <functional>
#include <string>

// Id encodings a graph may mix
enum class IdType : uint8_t {
    LONG = 1,
    STRING = 2
};

// Opaque vertex identifier. Two ids are equal only if both encoding and value match.
class VertexId {
public:
    VertexId() : type_(IdType::LONG), long_value_(0) {}

    static VertexId of_long(int64_t value);
    static VertexId of_string(std::string value);

    // Parse a configuration/input token: signed decimal integer -> LONG,
    // "quoted" -> STRING without quotes, anything else -> STRING
    static VertexId parse(const std::string& token);

    IdType type() const { return type_; }
    int64_t long_value() const { return long_value_; }
    const std::string& string_value() const { return string_value_; }

    std::string to_string() const;

    bool operator==(const VertexId& other) const;
    bool operator!=(const VertexId& other) const { return !(*this == other); }
    bool operator<(const VertexId& other) const;

    size_t hash() const;

private:
    IdType type_;
    int64_t long_value_;
    std::string string_value_;
};

namespace std {
template <>
struct hash<VertexId> {
    size_t operator()(const VertexId& id) const { return id.hash(); }
};
}  // namespace std
