#include "wire_codec.hpp"

void ByteWriter::write_string(const std::string& value) {
    write<uint32_t>(static_cast<uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::write_id(const VertexId& id) {
    write<uint8_t>(static_cast<uint8_t>(id.type()));
    if (id.type() == IdType::LONG) {
        write<int64_t>(id.long_value());
    } else {
        write_string(id.string_value());
    }
}

void ByteWriter::write_path(const std::vector<VertexId>& path) {
    write<uint32_t>(static_cast<uint32_t>(path.size()));
    for (const auto& id : path) {
        write_id(id);
    }
}

void ByteReader::require(size_t bytes) const {
    if (bytes > size_ - offset_) {
        throw std::runtime_error("Truncated payload: need " + std::to_string(bytes) +
                                 " bytes at offset " + std::to_string(offset_) +
                                 " of " + std::to_string(size_));
    }
}

std::string ByteReader::read_string() {
    uint32_t length = read<uint32_t>();
    require(length);
    std::string value(data_ + offset_, length);
    offset_ += length;
    return value;
}

VertexId ByteReader::read_id() {
    uint8_t type = read<uint8_t>();
    if (type == static_cast<uint8_t>(IdType::LONG)) {
        return VertexId::of_long(read<int64_t>());
    }
    if (type == static_cast<uint8_t>(IdType::STRING)) {
        return VertexId::of_string(read_string());
    }
    throw std::runtime_error("Unknown id type " + std::to_string(type));
}

std::vector<VertexId> ByteReader::read_path() {
    uint32_t length = read<uint32_t>();
    std::vector<VertexId> path;
    path.reserve(length);
    for (uint32_t i = 0; i < length; ++i) {
        path.push_back(read_id());
    }
    return path;
}

void encode_message(ByteWriter& writer, int32_t target, const RelaxationMessage& message) {
    writer.write<int32_t>(target);
    writer.write<double>(message.total_weight);
    writer.write_path(message.path);
}

RelaxationMessage decode_message(ByteReader& reader, int32_t& target) {
    RelaxationMessage message;
    target = reader.read<int32_t>();
    message.total_weight = reader.read<double>();
    message.path = reader.read_path();
    return message;
}

void encode_reached(ByteWriter& writer, const ReachedTargets& reached) {
    writer.write_path(reached.sorted_ids());
}

ReachedTargets decode_reached(ByteReader& reader) {
    ReachedTargets reached;
    for (const auto& id : reader.read_path()) {
        reached.add(id);
    }
    return reached;
}

void encode_result(ByteWriter& writer, int32_t vertex, const PathValue& value) {
    writer.write<int32_t>(vertex);
    writer.write<uint8_t>(value.reachable() ? 1 : 0);
    writer.write<double>(value.total_weight());
    writer.write_path(value.path());
}

PathValue decode_result(ByteReader& reader, int32_t& vertex) {
    vertex = reader.read<int32_t>();
    bool reachable = reader.read<uint8_t>() != 0;
    double weight = reader.read<double>();
    std::vector<VertexId> path = reader.read_path();

    PathValue value;
    value.unreachable();
    if (reachable) {
        if (path.empty()) {
            throw std::runtime_error("Reachable result without a path");
        }
        if (path.size() == 1 && weight == 0.0) {
            value.zero_distance(path.back());
        } else {
            VertexId self = path.back();
            path.pop_back();
            value.shorter_path(self, path, weight);
        }
    }
    return value;
}
