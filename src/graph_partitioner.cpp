#include "graph_partitioner.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>

GraphPartitioner::GraphPartitioner(const Graph& graph)
    : graph_(graph) {
}

std::vector<int32_t> GraphPartitioner::partition(int num_partitions, PartitionerType type) const {
    if (num_partitions <= 0) {
        throw std::invalid_argument("Invalid number of partitions");
    }
    if (num_partitions == 1 || graph_.get_num_vertices() == 0) {
        return std::vector<int32_t>(graph_.get_num_vertices(), 0);
    }
    if (type == PartitionerType::HASH || graph_.get_num_vertices() < num_partitions) {
        return partition_hash(num_partitions);
    }
    return partition_metis(num_partitions);
}

std::vector<int32_t> GraphPartitioner::partition_metis(int num_partitions) const {
    std::vector<idx_t> xadj;    // Adjacency list offsets
    std::vector<idx_t> adjncy;  // Adjacency list
    convert_to_metis_format(xadj, adjncy);

    // METIS options
    idx_t options[METIS_NOPTIONS];
    METIS_SetDefaultOptions(options);
    options[METIS_OPTION_NUMBERING] = 0;  // 0-based indexing

    // Partition parameters
    idx_t nvtxs = graph_.get_num_vertices();
    idx_t ncon = 1;  // Number of balancing constraints
    idx_t nparts = num_partitions;
    idx_t objval;  // Edge cut
    std::vector<idx_t> part(nvtxs);

    int result = METIS_PartGraphKway(&nvtxs, &ncon, xadj.data(), adjncy.data(),
                                     nullptr, nullptr, nullptr, &nparts,
                                     nullptr, nullptr, options, &objval, part.data());
    if (result != METIS_OK) {
        throw std::runtime_error("METIS partitioning failed with status " + std::to_string(result));
    }

    return std::vector<int32_t>(part.begin(), part.end());
}

std::vector<int32_t> GraphPartitioner::partition_hash(int num_partitions) const {
    std::vector<int32_t> assignments(graph_.get_num_vertices());
    for (int32_t v = 0; v < graph_.get_num_vertices(); ++v) {
        size_t h = std::hash<VertexId>()(graph_.vertex_id(v));
        assignments[v] = static_cast<int32_t>(h % static_cast<size_t>(num_partitions));
    }
    return assignments;
}

void GraphPartitioner::convert_to_metis_format(std::vector<idx_t>& xadj,
                                               std::vector<idx_t>& adjncy) const {
    int32_t num_vertices = graph_.get_num_vertices();

    // METIS needs a symmetric adjacency, so add both directions of every edge
    std::vector<std::vector<idx_t>> undirected(num_vertices);
    for (int32_t v = 0; v < num_vertices; ++v) {
        for (const auto& edge : graph_.get_neighbors(v)) {
            if (edge.dest == v) {
                continue;
            }
            undirected[v].push_back(edge.dest);
            undirected[edge.dest].push_back(v);
        }
    }

    xadj.resize(num_vertices + 1);
    xadj[0] = 0;
    adjncy.clear();
    for (int32_t v = 0; v < num_vertices; ++v) {
        auto& neighbors = undirected[v];
        std::sort(neighbors.begin(), neighbors.end());
        neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
        adjncy.insert(adjncy.end(), neighbors.begin(), neighbors.end());
        xadj[v + 1] = static_cast<idx_t>(adjncy.size());
    }
}
