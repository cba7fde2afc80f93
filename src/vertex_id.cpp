#include "vertex_id.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <utility>

VertexId VertexId::of_long(int64_t value) {
    VertexId id;
    id.type_ = IdType::LONG;
    id.long_value_ = value;
    return id;
}

VertexId VertexId::of_string(std::string value) {
    VertexId id;
    id.type_ = IdType::STRING;
    id.long_value_ = 0;
    id.string_value_ = std::move(value);
    return id;
}

static bool is_integer_literal(const std::string& token) {
    size_t start = 0;
    if (!token.empty() && (token[0] == '-' || token[0] == '+')) {
        start = 1;
    }
    if (start >= token.size() || token.size() - start > 18) {
        return false;
    }
    for (size_t i = start; i < token.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) {
            return false;
        }
    }
    return true;
}

VertexId VertexId::parse(const std::string& token) {
    if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
        return of_string(token.substr(1, token.size() - 2));
    }
    if (is_integer_literal(token)) {
        errno = 0;
        long long value = std::strtoll(token.c_str(), nullptr, 10);
        if (errno == 0) {
            return of_long(static_cast<int64_t>(value));
        }
    }
    return of_string(token);
}

std::string VertexId::to_string() const {
    if (type_ == IdType::LONG) {
        return std::to_string(long_value_);
    }
    return string_value_;
}

bool VertexId::operator==(const VertexId& other) const {
    if (type_ != other.type_) {
        return false;
    }
    if (type_ == IdType::LONG) {
        return long_value_ == other.long_value_;
    }
    return string_value_ == other.string_value_;
}

bool VertexId::operator<(const VertexId& other) const {
    if (type_ != other.type_) {
        return type_ < other.type_;
    }
    if (type_ == IdType::LONG) {
        return long_value_ < other.long_value_;
    }
    return string_value_ < other.string_value_;
}

size_t VertexId::hash() const {
    size_t seed = std::hash<int>()(static_cast<int>(type_));
    size_t value = type_ == IdType::LONG ? std::hash<int64_t>()(long_value_)
                                         : std::hash<std::string>()(string_value_);
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}
