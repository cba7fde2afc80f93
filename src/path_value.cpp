#include "path_value.hpp"
#include <cmath>
#include <stdexcept>

void PathValue::unreachable() {
    reachable_ = false;
    total_weight_ = std::numeric_limits<double>::infinity();
    path_.clear();
}

void PathValue::zero_distance(const VertexId& self) {
    reachable_ = true;
    total_weight_ = 0.0;
    path_.assign(1, self);
}

void PathValue::shorter_path(const VertexId& self, const std::vector<VertexId>& prefix,
                             double weight) {
    if (!(weight < total_weight_) || !std::isfinite(weight)) {
        throw std::invalid_argument("Path weight " + std::to_string(weight) +
                                    " does not improve on " + std::to_string(total_weight_) +
                                    " for vertex " + self.to_string());
    }
    reachable_ = true;
    total_weight_ = weight;
    path_.reserve(prefix.size() + 1);
    path_.assign(prefix.begin(), prefix.end());
    path_.push_back(self);
}
