#pragma once

#include "path_value.hpp"
#include "reached_targets.hpp"
#include "relaxation_message.hpp"
#include "vertex_id.hpp"
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// Append-only byte buffer for MPI_BYTE payloads
class ByteWriter {
public:
    explicit ByteWriter(std::vector<char>& buffer) : buffer_(buffer) {}

    template <typename T>
    void write(const T& value) {
        static_assert(std::is_trivially_copyable<T>::value, "POD values only");
        const char* bytes = reinterpret_cast<const char*>(&value);
        buffer_.insert(buffer_.end(), bytes, bytes + sizeof(T));
    }

    void write_string(const std::string& value);
    void write_id(const VertexId& id);
    void write_path(const std::vector<VertexId>& path);

private:
    std::vector<char>& buffer_;
};

// Sequential reader over a received payload; throws std::runtime_error on truncation
class ByteReader {
public:
    ByteReader(const char* data, size_t size) : data_(data), size_(size), offset_(0) {}

    template <typename T>
    T read() {
        static_assert(std::is_trivially_copyable<T>::value, "POD values only");
        require(sizeof(T));
        T value;
        std::memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    std::string read_string();
    VertexId read_id();
    std::vector<VertexId> read_path();

    bool at_end() const { return offset_ == size_; }

private:
    const char* data_;
    size_t size_;
    size_t offset_;

    void require(size_t bytes) const;
};

// Message record: target global index, weight, path
void encode_message(ByteWriter& writer, int32_t target, const RelaxationMessage& message);
RelaxationMessage decode_message(ByteReader& reader, int32_t& target);

void encode_reached(ByteWriter& writer, const ReachedTargets& reached);
ReachedTargets decode_reached(ByteReader& reader);

// Result record: global index, reachable, weight, path
void encode_result(ByteWriter& writer, int32_t vertex, const PathValue& value);
PathValue decode_result(ByteReader& reader, int32_t& vertex);
