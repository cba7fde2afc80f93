#pragma once

#include "target_spec.hpp"
#include "vertex_id.hpp"
#include <unordered_set>
#include <vector>

// Set of targets already reached; only ever grows over a job
class ReachedTargets {
public:
    ReachedTargets() = default;

    void add(const VertexId& id) { ids_.insert(id); }
    bool contains(const VertexId& id) const { return ids_.find(id) != ids_.end(); }
    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    // Set union in place
    void merge(const ReachedTargets& other);

    // Ids in VertexId order
    std::vector<VertexId> sorted_ids() const;

    const std::unordered_set<VertexId>& ids() const { return ids_; }

private:
    std::unordered_set<VertexId> ids_;
};

// Worker-side replica of the global reached-target set.
// before_superstep() installs the merged global value, record() collects local
// discoveries, after_superstep() hands back the replica for the cross-worker union.
class ReachedTargetAggregator {
public:
    explicit ReachedTargetAggregator(const TargetSpec& spec);

    void before_superstep(const ReachedTargets& global);

    // Record a locally reached target; ids outside the target set are ignored
    void record(const VertexId& id);

    ReachedTargets after_superstep() const;

    // Merged global value as installed at the start of the superstep
    const ReachedTargets& global() const { return global_; }

    // Global value plus this superstep's local discoveries
    const ReachedTargets& replica() const { return replica_; }

    // SINGLE: vertex is the sole target. MULTIPLE: the merged set holds every
    // target (counting vertex itself when it is a target). ALL: never.
    bool is_all_targets_reached(const VertexId& vertex) const;

    // Merged set covers every configured target; false for ALL
    bool all_targets_reached() const;

private:
    const TargetSpec& spec_;
    ReachedTargets global_;
    ReachedTargets replica_;
};
