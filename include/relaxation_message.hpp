#pragma once

#include "vertex_id.hpp"
#include <vector>

// Relaxation candidate sent across a superstep boundary.
// path is the prefix ending at the sender; total_weight includes the traversed edge.
struct RelaxationMessage {
    std::vector<VertexId> path;
    double total_weight = 0.0;
};
