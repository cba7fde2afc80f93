#pragma once

#include "property.hpp"
#include "vertex_id.hpp"
#include <cstdint>
#include <unordered_map>
#include <vector>

// Outgoing edge structure
struct Edge {
    int32_t dest;           // global vertex index
    Properties properties;
};

// Directed property graph. Every worker holds the same global indexing and
// owns the subset of vertices assigned to its rank.
class Graph {
public:
    Graph() = default;
    ~Graph() = default;

    // Add vertex if missing, return its global index
    int32_t add_vertex(const VertexId& id);

    // Add directed edge, creating missing endpoints
    void add_edge(const VertexId& src, const VertexId& dest, Properties properties = {});

    // Get number of vertices
    int32_t get_num_vertices() const { return static_cast<int32_t>(vertex_ids_.size()); }

    // Get number of edges
    int64_t get_num_edges() const { return num_edges_; }

    // Global index of id, -1 if absent
    int32_t index_of(const VertexId& id) const;

    // Id of global vertex
    const VertexId& vertex_id(int32_t vertex) const;

    // Get outgoing edges of vertex
    const std::vector<Edge>& get_neighbors(int32_t vertex) const;

    // Setup ownership for this rank from partition assignments
    void setup_vertex_mappings(const std::vector<int32_t>& partition_assignments, int rank);

    // Get vertex owner
    int32_t get_vertex_owner(int32_t vertex) const;

    // Number of vertices owned by this rank
    int32_t get_num_local_vertices() const { return static_cast<int32_t>(local_to_global_.size()); }

    // Convert global vertex to local, -1 if not owned by this rank
    int32_t global_to_local(int32_t global_vertex) const;

    // Convert local vertex to global
    int32_t local_to_global(int32_t local_vertex) const;

    int get_rank() const { return rank_; }

private:
    std::vector<VertexId> vertex_ids_;
    std::unordered_map<VertexId, int32_t> index_;
    std::vector<std::vector<Edge>> adjacency_list_;
    int64_t num_edges_ = 0;
    int rank_ = 0;

    // Vertex mapping arrays
    std::vector<int32_t> vertex_owner_;    // Global vertex -> owner rank
    std::vector<int32_t> global_to_local_; // Global vertex -> local index
    std::vector<int32_t> local_to_global_; // Local index -> global vertex

    void check_vertex(int32_t vertex) const;
};
