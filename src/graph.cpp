#include "graph.hpp"
#include <stdexcept>
#include <string>
#include <utility>

int32_t Graph::add_vertex(const VertexId& id) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        return it->second;
    }
    int32_t vertex = get_num_vertices();
    vertex_ids_.push_back(id);
    index_.emplace(id, vertex);
    adjacency_list_.emplace_back();
    return vertex;
}

void Graph::add_edge(const VertexId& src, const VertexId& dest, Properties properties) {
    int32_t src_index = add_vertex(src);
    int32_t dest_index = add_vertex(dest);
    adjacency_list_[src_index].push_back(Edge{dest_index, std::move(properties)});
    ++num_edges_;
}

int32_t Graph::index_of(const VertexId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? -1 : it->second;
}

void Graph::check_vertex(int32_t vertex) const {
    if (vertex < 0 || vertex >= get_num_vertices()) {
        throw std::invalid_argument("Invalid vertex index " + std::to_string(vertex));
    }
}

const VertexId& Graph::vertex_id(int32_t vertex) const {
    check_vertex(vertex);
    return vertex_ids_[vertex];
}

const std::vector<Edge>& Graph::get_neighbors(int32_t vertex) const {
    check_vertex(vertex);
    return adjacency_list_[vertex];
}

void Graph::setup_vertex_mappings(const std::vector<int32_t>& partition_assignments, int rank) {
    if (partition_assignments.size() != vertex_ids_.size()) {
        throw std::invalid_argument("Invalid partition assignments size");
    }

    rank_ = rank;
    vertex_owner_.assign(partition_assignments.begin(), partition_assignments.end());
    global_to_local_.assign(vertex_ids_.size(), -1);
    local_to_global_.clear();

    for (int32_t v = 0; v < get_num_vertices(); ++v) {
        if (partition_assignments[v] == rank) {
            global_to_local_[v] = static_cast<int32_t>(local_to_global_.size());
            local_to_global_.push_back(v);
        }
    }
}

int32_t Graph::get_vertex_owner(int32_t vertex) const {
    check_vertex(vertex);
    if (vertex_owner_.empty()) {
        throw std::logic_error("Vertex mappings are not set up");
    }
    return vertex_owner_[vertex];
}

int32_t Graph::global_to_local(int32_t global_vertex) const {
    check_vertex(global_vertex);
    if (global_to_local_.empty()) {
        throw std::logic_error("Vertex mappings are not set up");
    }
    return global_to_local_[global_vertex];
}

int32_t Graph::local_to_global(int32_t local_vertex) const {
    if (local_vertex < 0 || local_vertex >= get_num_local_vertices()) {
        throw std::invalid_argument("Invalid local vertex index " + std::to_string(local_vertex));
    }
    return local_to_global_[local_vertex];
}
