#pragma once

#include "graph.hpp"
#include "options.hpp"
#include "path_value.hpp"
#include "reached_targets.hpp"
#include "relaxation_message.hpp"
#include "shortest_path.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

// One BSP worker: the vertices of one partition, their values and inboxes,
// and the local replica of the reached-target aggregator
class Worker {
public:
    Worker(const Graph& graph, const ShortestPathOptions& options, int rank, int num_workers);
    ~Worker() = default;

    // Install the merged reached-target set for this superstep
    void before_superstep(const ReachedTargets& global);

    // Superstep 0 runs the init step on every local vertex, later supersteps run
    // the steady-state step on vertices holding a combined message
    void compute_superstep(int superstep);

    // Replica submitted for the cross-worker union
    ReachedTargets after_superstep() const;

    // Encoded outbox per destination rank; the outbox is emptied
    std::vector<std::vector<char>> take_outgoing();

    // Decode a payload of messages addressed to this worker and combine into the inbox
    void receive_payload(const char* data, size_t size);

    // Combine one message into the inbox of a local vertex
    void receive(int32_t global_vertex, RelaxationMessage&& message);

    // Encoded (global index, value) records for every local vertex
    std::vector<char> encode_results() const;

    int rank() const { return rank_; }
    int64_t messages_sent() const { return messages_sent_; }
    int64_t active_vertices() const { return active_vertices_; }
    int64_t pending_messages() const;

    const PathValue& get_value(int32_t global_vertex) const;
    const ReachedTargetAggregator& aggregator() const { return aggregator_; }

private:
    const Graph& graph_;
    int rank_;
    int num_workers_;
    SingleSourceShortestPath computation_;
    ReachedTargetAggregator aggregator_;

    std::vector<PathValue> values_;                      // By local index
    std::vector<std::optional<RelaxationMessage>> inbox_; // By local index
    std::vector<std::unordered_map<int32_t, RelaxationMessage>> outbox_;  // By owner rank

    int64_t messages_sent_;
    int64_t active_vertices_;

    void apply_result(int32_t local_vertex, StepResult&& result);
};
