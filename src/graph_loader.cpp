#include "graph_loader.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <vector>

static std::vector<std::string> tokenize(const std::string& line, int line_number) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            current.push_back(c);
        } else if (!in_quotes && (c == ' ' || c == '\t' || c == '\r')) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (in_quotes) {
        throw GraphFormatError("Line " + std::to_string(line_number) + ": unterminated quote");
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

static Properties parse_properties(const std::vector<std::string>& tokens, size_t first,
                                   int line_number) {
    Properties properties;
    for (size_t i = first; i < tokens.size(); ++i) {
        size_t pos = tokens[i].find('=');
        if (pos == std::string::npos || pos == 0) {
            throw GraphFormatError("Line " + std::to_string(line_number) +
                                   ": expected key=value, actual got '" + tokens[i] + "'");
        }
        properties[tokens[i].substr(0, pos)] = parse_property_value(tokens[i].substr(pos + 1));
    }
    return properties;
}

Graph load_graph(std::istream& input, bool both_directions) {
    Graph graph;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        std::vector<std::string> tokens = tokenize(content, line_number);
        const std::string& kind = tokens[0];

        if (kind == "v") {
            if (tokens.size() != 2) {
                throw GraphFormatError("Line " + std::to_string(line_number) +
                                       ": vertex record takes exactly one id");
            }
            graph.add_vertex(VertexId::parse(tokens[1]));
        } else if (kind == "e") {
            if (tokens.size() < 3) {
                throw GraphFormatError("Line " + std::to_string(line_number) +
                                       ": edge record needs source and target ids");
            }
            VertexId src = VertexId::parse(tokens[1]);
            VertexId dest = VertexId::parse(tokens[2]);
            Properties properties = parse_properties(tokens, 3, line_number);
            if (both_directions) {
                graph.add_edge(dest, src, properties);
            }
            graph.add_edge(src, dest, std::move(properties));
        } else {
            throw GraphFormatError("Line " + std::to_string(line_number) +
                                   ": unknown record type '" + kind + "'");
        }
    }
    return graph;
}

Graph load_graph_file(const std::string& filename, bool both_directions) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw GraphFormatError("Failed to open graph file: " + filename);
    }
    return load_graph(file, both_directions);
}
