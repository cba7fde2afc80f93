#include "result_writer.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

static std::string json_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                    escaped += buffer;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

// LONG ids as numbers, STRING ids as strings
static std::string json_id(const VertexId& id) {
    if (id.type() == IdType::LONG) {
        return id.to_string();
    }
    return "\"" + json_escape(id.string_value()) + "\"";
}

void write_results_json(std::ostream& out, const Graph& graph, const TargetSpec& spec,
                        const std::map<int32_t, PathValue>& results) {
    out.precision(std::numeric_limits<double>::max_digits10);

    out << "{\n";
    out << "  \"source\": " << json_id(spec.source_id) << ",\n";
    out << "  \"target_quantity\": \"" << quantity_name(spec.quantity) << "\",\n";

    out << "  \"targets\": [";
    std::vector<VertexId> targets(spec.target_ids.begin(), spec.target_ids.end());
    std::sort(targets.begin(), targets.end());
    for (size_t i = 0; i < targets.size(); ++i) {
        out << (i == 0 ? "" : ", ") << json_id(targets[i]);
    }
    out << "],\n";

    out << "  \"vertices\": [\n";
    size_t written = 0;
    for (const auto& [vertex, value] : results) {
        out << "    {\n";
        out << "      \"id\": " << json_id(graph.vertex_id(vertex)) << ",\n";
        out << "      \"reachable\": " << (value.reachable() ? "true" : "false") << ",\n";
        if (value.reachable()) {
            out << "      \"total_weight\": " << value.total_weight() << ",\n";
        } else {
            out << "      \"total_weight\": null,\n";
        }
        out << "      \"path\": [";
        for (size_t i = 0; i < value.path().size(); ++i) {
            out << (i == 0 ? "" : ", ") << json_id(value.path()[i]);
        }
        out << "]\n";
        out << "    }";
        if (++written < results.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << "  ]\n";
    out << "}\n";
}

void export_results_json(const std::string& filename, const Graph& graph, const TargetSpec& spec,
                         const std::map<int32_t, PathValue>& results) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    write_results_json(file, graph, spec, results);
    if (!file) {
        throw std::runtime_error("Failed to write results to " + filename);
    }
}
