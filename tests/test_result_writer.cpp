#include "result_writer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

TEST(ResultWriterTest, WritesIdsByTypeAndNullForUnreachable) {
    Graph graph;
    graph.add_edge(VertexId::of_long(1), VertexId::of_string("b\"x"), weighted(2.5));
    graph.add_vertex(VertexId::of_string("far"));
    TargetSpec spec = parse_target_spec("1", "far");

    std::map<int32_t, PathValue> results;
    results[0].zero_distance(VertexId::of_long(1));
    results[1].shorter_path(VertexId::of_string("b\"x"), {VertexId::of_long(1)}, 2.5);
    results[2].unreachable();

    std::ostringstream out;
    write_results_json(out, graph, spec, results);
    std::string json = out.str();

    EXPECT_NE(json.find("\"source\": 1,"), std::string::npos);
    EXPECT_NE(json.find("\"target_quantity\": \"SINGLE\""), std::string::npos);
    EXPECT_NE(json.find("\"id\": 1,"), std::string::npos);
    EXPECT_NE(json.find("\"id\": \"b\\\"x\","), std::string::npos);
    EXPECT_NE(json.find("\"total_weight\": 2.5,"), std::string::npos);
    EXPECT_NE(json.find("\"path\": [1, \"b\\\"x\"]"), std::string::npos);
    EXPECT_NE(json.find("\"total_weight\": null,"), std::string::npos);
    EXPECT_NE(json.find("\"path\": []"), std::string::npos);
    EXPECT_EQ(json.back(), '\n');
}

TEST(ResultWriterTest, AllModeListsNoTargets) {
    Graph graph;
    graph.add_vertex(id("S"));
    TargetSpec spec = parse_target_spec("S", "*");
    std::map<int32_t, PathValue> results;
    results[0].zero_distance(id("S"));

    std::ostringstream out;
    write_results_json(out, graph, spec, results);
    EXPECT_NE(out.str().find("\"targets\": [],"), std::string::npos);
    EXPECT_NE(out.str().find("\"target_quantity\": \"ALL\""), std::string::npos);
    EXPECT_NE(out.str().find("\"total_weight\": 0,"), std::string::npos);
}

TEST(ResultWriterTest, UnwritableFileThrows) {
    Graph graph;
    TargetSpec spec = parse_target_spec("S", "*");
    EXPECT_THROW(export_results_json("/nonexistent/dir/out.json", graph, spec, {}), std::runtime_error);
}
