#pragma once

#include "graph.hpp"
#include "options.hpp"
#include <cstdint>
#include <vector>
#include <metis.h>

class GraphPartitioner {
public:
    explicit GraphPartitioner(const Graph& graph);
    ~GraphPartitioner() = default;

    // Assign every vertex to one of num_partitions parts
    std::vector<int32_t> partition(int num_partitions, PartitionerType type) const;

    // METIS k-way partition over the symmetrised adjacency
    std::vector<int32_t> partition_metis(int num_partitions) const;

    // Partition by VertexId hash
    std::vector<int32_t> partition_hash(int num_partitions) const;

private:
    const Graph& graph_;

    // Convert graph to METIS format (undirected, no self loops, no duplicate edges)
    void convert_to_metis_format(std::vector<idx_t>& xadj, std::vector<idx_t>& adjncy) const;
};
