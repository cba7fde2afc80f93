#include "shortest_path.hpp"
#include "errors.hpp"
#include <cmath>
#include <iostream>
#include <utility>

SingleSourceShortestPath::SingleSourceShortestPath(const Graph& graph, const TargetSpec& spec,
                                                   EdgeWeightConfig weight, bool verbose)
    : graph_(graph),
      spec_(spec),
      weights_(std::move(weight)),
      verbose_(verbose) {
}

StepResult SingleSourceShortestPath::compute0(int32_t vertex) const {
    StepResult result;
    result.value.unreachable();

    const VertexId& id = graph_.vertex_id(vertex);
    if (id != spec_.source_id) {
        return result;
    }
    result.value.zero_distance(id);

    if (spec_.quantity == QuantityType::SINGLE && spec_.single_target() == id) {
        if (verbose_) {
            std::cout << "Rank " << graph_.get_rank() << ": Source vertex " << id.to_string()
                      << " equals target vertex" << std::endl;
        }
        return result;
    }

    if (graph_.get_neighbors(vertex).empty()) {
        if (verbose_) {
            std::cout << "Rank " << graph_.get_rank() << ": Source vertex " << id.to_string()
                      << " is isolated and can not reach any target" << std::endl;
        }
        return result;
    }

    send_to_neighbors(vertex, result.value, result.messages);
    return result;
}

StepResult SingleSourceShortestPath::compute(int32_t vertex, PathValue value,
                                             const std::vector<RelaxationMessage>& messages,
                                             const ReachedTargetAggregator& reached) const {
    StepResult result;
    result.value = std::move(value);

    const VertexId& id = graph_.vertex_id(vertex);
    bool is_target = spec_.is_target(id);
    if (is_target && !reached.replica().contains(id)) {
        result.reached_target = true;
    }

    for (const auto& message : messages) {
        if (!(message.total_weight < result.value.total_weight())) {
            continue;
        }
        result.value.shorter_path(id, message.path, message.total_weight);

        // Reached every target or nowhere to go
        if ((is_target && reached.is_all_targets_reached(id)) ||
            graph_.get_neighbors(vertex).empty()) {
            continue;
        }
        send_to_neighbors(vertex, result.value, result.messages);
    }
    return result;
}

void SingleSourceShortestPath::send_to_neighbors(int32_t vertex, const PathValue& value,
                                                 std::vector<OutboundMessage>& out) const {
    const auto& edges = graph_.get_neighbors(vertex);
    out.reserve(out.size() + edges.size());
    for (const auto& edge : edges) {
        RelaxationMessage message;
        message.path = value.path();
        message.total_weight = value.total_weight() + weights_.weight(edge.properties);
        if (!std::isfinite(message.total_weight)) {
            throw ValueRangeError("The total weight of the path from " +
                                  graph_.vertex_id(vertex).to_string() + " to " +
                                  graph_.vertex_id(edge.dest).to_string() +
                                  " is not a finite number");
        }
        out.push_back(OutboundMessage{edge.dest, std::move(message)});
    }
}
