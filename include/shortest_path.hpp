#pragma once

#include "edge_weight.hpp"
#include "graph.hpp"
#include "path_value.hpp"
#include "reached_targets.hpp"
#include "relaxation_message.hpp"
#include "target_spec.hpp"
#include <cstdint>
#include <vector>

// Message addressed to a global vertex index
struct OutboundMessage {
    int32_t target;
    RelaxationMessage message;
};

// Outcome of one compute call for one vertex. The vertex is always inactive
// afterwards and is woken up only by a message in the next superstep.
struct StepResult {
    PathValue value;
    std::vector<OutboundMessage> messages;
    bool reached_target = false;  // vertex is a target seen for the first time
};

// Single source shortest path as a vertex program: compute0() runs once per vertex
// in superstep 0, compute() runs for each vertex that received a combined message.
class SingleSourceShortestPath {
public:
    SingleSourceShortestPath(const Graph& graph, const TargetSpec& spec, EdgeWeightConfig weight,
                             bool verbose = false);

    static const char* category() { return "path"; }
    static const char* name() { return "single_source_shortest_path"; }

    // Init step for a global vertex
    StepResult compute0(int32_t vertex) const;

    // Steady-state step; value is the vertex's current state and is returned updated
    StepResult compute(int32_t vertex, PathValue value,
                       const std::vector<RelaxationMessage>& messages,
                       const ReachedTargetAggregator& reached) const;

    const TargetSpec& target_spec() const { return spec_; }

private:
    const Graph& graph_;
    const TargetSpec& spec_;
    EdgeWeightResolver weights_;
    bool verbose_;

    // One message per outgoing edge, carrying value's path and weight plus the edge weight
    void send_to_neighbors(int32_t vertex, const PathValue& value,
                           std::vector<OutboundMessage>& out) const;
};
