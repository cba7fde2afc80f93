#pragma once

#include "graph.hpp"
#include <istream>
#include <string>

// Text input format, one record per line:
//   # comment
//   v <id>                          vertex (for isolated vertices)
//   e <src> <dst> [key=value ...]   directed edge, endpoints created on demand
// Ids follow VertexId::parse, values follow parse_property_value.
// When both_directions is set every edge is also added reversed.
Graph load_graph(std::istream& input, bool both_directions = false);

// Throws GraphFormatError if the file cannot be opened or a line is malformed
Graph load_graph_file(const std::string& filename, bool both_directions = false);
