#pragma once

#include "graph.hpp"
#include "path_value.hpp"
#include "target_spec.hpp"
#include <cstdint>
#include <map>
#include <ostream>
#include <string>

// Write final path values as JSON:
// {"source": .., "target_quantity": .., "targets": [..],
//  "vertices": [{"id": .., "reachable": .., "total_weight": .., "path": [..]}]}
// Unreachable vertices carry "total_weight": null and an empty path.
void write_results_json(std::ostream& out, const Graph& graph, const TargetSpec& spec,
                        const std::map<int32_t, PathValue>& results);

// Throws std::runtime_error if the file cannot be written
void export_results_json(const std::string& filename, const Graph& graph, const TargetSpec& spec,
                         const std::map<int32_t, PathValue>& results);
