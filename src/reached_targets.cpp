#include "reached_targets.hpp"
#include <algorithm>

void ReachedTargets::merge(const ReachedTargets& other) {
    ids_.insert(other.ids_.begin(), other.ids_.end());
}

std::vector<VertexId> ReachedTargets::sorted_ids() const {
    std::vector<VertexId> ids(ids_.begin(), ids_.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

ReachedTargetAggregator::ReachedTargetAggregator(const TargetSpec& spec)
    : spec_(spec) {
}

void ReachedTargetAggregator::before_superstep(const ReachedTargets& global) {
    global_ = global;
    replica_ = global;
}

void ReachedTargetAggregator::record(const VertexId& id) {
    if (spec_.quantity != QuantityType::ALL && spec_.is_target(id)) {
        replica_.add(id);
    }
}

ReachedTargets ReachedTargetAggregator::after_superstep() const {
    return replica_;
}

bool ReachedTargetAggregator::is_all_targets_reached(const VertexId& vertex) const {
    if (spec_.quantity == QuantityType::SINGLE) {
        return spec_.is_target(vertex);
    }
    if (spec_.quantity == QuantityType::MULTIPLE) {
        bool self_is_target = spec_.is_target(vertex);
        size_t reached = global_.size();
        if (self_is_target && !global_.contains(vertex)) {
            ++reached;
        }
        if (reached != spec_.target_ids.size()) {
            return false;
        }
        for (const auto& target : spec_.target_ids) {
            if (!global_.contains(target) && !(self_is_target && target == vertex)) {
                return false;
            }
        }
        return true;
    }
    return false;
}

bool ReachedTargetAggregator::all_targets_reached() const {
    if (spec_.quantity == QuantityType::ALL) {
        return false;
    }
    for (const auto& target : spec_.target_ids) {
        if (!global_.contains(target)) {
            return false;
        }
    }
    return true;
}
