#include "errors.hpp"
#include "shortest_path.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <gtest/gtest.h>

namespace {

class ShortestPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        // S -> A (1), S -> B (4), A -> B (2), A -> T (6), B -> T (1)
        graph_.add_edge(id("S"), id("A"), weighted(1.0));
        graph_.add_edge(id("S"), id("B"), weighted(4.0));
        graph_.add_edge(id("A"), id("B"), weighted(2.0));
        graph_.add_edge(id("A"), id("T"), weighted(6.0));
        graph_.add_edge(id("B"), id("T"), weighted(1.0));
        graph_.add_vertex(id("I"));
        own_all(graph_);
    }

    int32_t v(const std::string& token) const { return graph_.index_of(id(token)); }

    RelaxationMessage message(const std::vector<std::string>& path, double weight) const {
        RelaxationMessage m;
        m.path = ids(path);
        m.total_weight = weight;
        return m;
    }

    Graph graph_;
};

}  // namespace

TEST_F(ShortestPathTest, InitLeavesNonSourceUnreachable) {
    ShortestPathOptions options = make_options("S", "T");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);

    StepResult result = computation.compute0(v("A"));
    EXPECT_FALSE(result.value.reachable());
    EXPECT_TRUE(std::isinf(result.value.total_weight()));
    EXPECT_TRUE(result.messages.empty());
}

TEST_F(ShortestPathTest, InitSourceSendsOneMessagePerEdge) {
    ShortestPathOptions options = make_options("S", "T");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);

    StepResult result = computation.compute0(v("S"));
    EXPECT_TRUE(result.value.reachable());
    EXPECT_DOUBLE_EQ(result.value.total_weight(), 0.0);
    EXPECT_EQ(result.value.path(), ids({"S"}));

    ASSERT_EQ(result.messages.size(), 2u);
    EXPECT_EQ(result.messages[0].target, v("A"));
    EXPECT_DOUBLE_EQ(result.messages[0].message.total_weight, 1.0);
    EXPECT_EQ(result.messages[0].message.path, ids({"S"}));
    EXPECT_EQ(result.messages[1].target, v("B"));
    EXPECT_DOUBLE_EQ(result.messages[1].message.total_weight, 4.0);
}

TEST_F(ShortestPathTest, InitSourceEqualToSingleTargetSendsNothing) {
    ShortestPathOptions options = make_options("S", "S");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);

    StepResult result = computation.compute0(v("S"));
    EXPECT_DOUBLE_EQ(result.value.total_weight(), 0.0);
    EXPECT_EQ(result.value.path(), ids({"S"}));
    EXPECT_TRUE(result.messages.empty());
}

TEST_F(ShortestPathTest, InitIsolatedSourceSendsNothing) {
    ShortestPathOptions options = make_options("I", "T");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);

    StepResult result = computation.compute0(v("I"));
    EXPECT_TRUE(result.value.reachable());
    EXPECT_TRUE(result.messages.empty());
}

TEST_F(ShortestPathTest, StepAdoptsStrictImprovementAndForwards) {
    ShortestPathOptions options = make_options("S", "T");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    PathValue current;
    current.unreachable();
    StepResult result = computation.compute(v("A"), current, {message({"S"}, 1.0)}, reached);

    EXPECT_EQ(result.value.path(), ids({"S", "A"}));
    EXPECT_DOUBLE_EQ(result.value.total_weight(), 1.0);
    EXPECT_FALSE(result.reached_target);
    ASSERT_EQ(result.messages.size(), 2u);
    EXPECT_EQ(result.messages[0].target, v("B"));
    EXPECT_DOUBLE_EQ(result.messages[0].message.total_weight, 3.0);
    EXPECT_EQ(result.messages[0].message.path, ids({"S", "A"}));
    EXPECT_DOUBLE_EQ(result.messages[1].message.total_weight, 7.0);
}

TEST_F(ShortestPathTest, StepIgnoresEqualOrHeavierCandidates) {
    ShortestPathOptions options = make_options("S", "T");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    PathValue current;
    current.shorter_path(id("B"), ids({"S"}), 3.0);

    StepResult tie = computation.compute(v("B"), current, {message({"S", "X"}, 3.0)}, reached);
    EXPECT_EQ(tie.value.path(), ids({"S", "B"}));
    EXPECT_TRUE(tie.messages.empty());

    StepResult heavier = computation.compute(v("B"), current, {message({"S", "A"}, 4.0)}, reached);
    EXPECT_DOUBLE_EQ(heavier.value.total_weight(), 3.0);
    EXPECT_TRUE(heavier.messages.empty());
}

TEST_F(ShortestPathTest, TargetFlagsFirstArrival) {
    ShortestPathOptions options = make_options("S", "T,B");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    PathValue current;
    current.unreachable();
    StepResult first = computation.compute(v("B"), current, {message({"S"}, 4.0)}, reached);
    EXPECT_TRUE(first.reached_target);

    ReachedTargets global;
    global.add(id("B"));
    reached.before_superstep(global);
    StepResult again = computation.compute(v("B"), first.value, {message({"S", "A"}, 3.0)}, reached);
    EXPECT_FALSE(again.reached_target);
}

TEST_F(ShortestPathTest, SingleTargetAdoptsButDoesNotForward) {
    ShortestPathOptions options = make_options("S", "B");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    PathValue current;
    current.unreachable();
    StepResult result = computation.compute(v("B"), current, {message({"S", "A"}, 3.0)}, reached);
    EXPECT_EQ(result.value.path(), ids({"S", "A", "B"}));
    EXPECT_TRUE(result.reached_target);
    EXPECT_TRUE(result.messages.empty());
}

TEST_F(ShortestPathTest, MultipleTargetsStopForwardingOnceAllReached) {
    ShortestPathOptions options = make_options("S", "A,B");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);

    PathValue current;
    current.unreachable();

    // Nothing merged yet: A still forwards
    reached.before_superstep(ReachedTargets());
    StepResult open = computation.compute(v("A"), current, {message({"S"}, 1.0)}, reached);
    EXPECT_EQ(open.messages.size(), 2u);

    // B merged, A completes the set itself
    ReachedTargets global;
    global.add(id("B"));
    reached.before_superstep(global);
    StepResult completing = computation.compute(v("A"), current, {message({"S"}, 1.0)}, reached);
    EXPECT_TRUE(completing.messages.empty());

    // Both merged: A adopts but stops
    global.add(id("A"));
    reached.before_superstep(global);
    StepResult closed = computation.compute(v("A"), current, {message({"S"}, 1.0)}, reached);
    EXPECT_DOUBLE_EQ(closed.value.total_weight(), 1.0);
    EXPECT_TRUE(closed.messages.empty());

    // A non-target keeps forwarding
    StepResult other = computation.compute(v("S"), current, {message({"A"}, 5.0)}, reached);
    EXPECT_EQ(other.messages.size(), 2u);
}

TEST_F(ShortestPathTest, VertexWithoutEdgesDoesNotForward) {
    ShortestPathOptions options = make_options("S", "*");
    SingleSourceShortestPath computation(graph_, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    PathValue current;
    current.unreachable();
    StepResult result = computation.compute(v("T"), current, {message({"S", "B"}, 5.0)}, reached);
    EXPECT_TRUE(result.value.reachable());
    EXPECT_FALSE(result.reached_target);
    EXPECT_TRUE(result.messages.empty());
}

TEST_F(ShortestPathTest, InvalidWeightFailsWhenEdgeIsTraversed) {
    Graph graph;
    graph.add_edge(id("S"), id("A"), weighted(1.0));
    graph.add_edge(id("A"), id("B"), Properties{{"weight", PropertyValue(std::string("far"))}});
    own_all(graph);

    ShortestPathOptions options = make_options("S", "B");
    SingleSourceShortestPath computation(graph, options.target_spec, options.weight);
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    EXPECT_NO_THROW(computation.compute0(graph.index_of(id("S"))));
    PathValue current;
    current.unreachable();
    EXPECT_THROW(computation.compute(graph.index_of(id("A")), current,
                                     {message({"S"}, 1.0)}, reached),
                 ValueTypeError);
}

TEST_F(ShortestPathTest, OverflowingPathWeightIsRangeError) {
    Graph graph;
    graph.add_edge(id("S"), id("A"));
    graph.add_edge(id("A"), id("B"));
    own_all(graph);

    ShortestPathOptions options = make_options("S", "B");
    SingleSourceShortestPath computation(graph, options.target_spec,
                                         EdgeWeightConfig{"weight", 1e308});
    ReachedTargetAggregator reached(options.target_spec);
    reached.before_superstep(ReachedTargets());

    StepResult init = computation.compute0(graph.index_of(id("S")));
    ASSERT_EQ(init.messages.size(), 1u);
    EXPECT_DOUBLE_EQ(init.messages[0].message.total_weight, 1e308);

    PathValue current;
    current.unreachable();
    EXPECT_THROW(computation.compute(graph.index_of(id("A")), current,
                                     {init.messages[0].message}, reached),
                 ValueRangeError);
}
