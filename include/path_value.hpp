#pragma once

#include "vertex_id.hpp"
#include <limits>
#include <vector>

// Per-vertex shortest path state, mutated only by the vertex's own compute call
class PathValue {
public:
    PathValue() = default;

    // Reset to reachable=false, total_weight=+inf, empty path
    void unreachable();

    // Source vertex: reachable with weight 0 and path [self]
    void zero_distance(const VertexId& self);

    // Adopt a strictly shorter path; prefix ends at the sender, self is appended.
    // Throws std::invalid_argument if weight does not improve on the current one.
    void shorter_path(const VertexId& self, const std::vector<VertexId>& prefix, double weight);

    bool reachable() const { return reachable_; }
    double total_weight() const { return total_weight_; }
    const std::vector<VertexId>& path() const { return path_; }

private:
    bool reachable_ = false;
    double total_weight_ = std::numeric_limits<double>::infinity();
    std::vector<VertexId> path_;
};
