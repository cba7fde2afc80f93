#include "reached_targets.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

TEST(ReachedTargetsTest, MergeIsSetUnion) {
    ReachedTargets a;
    a.add(id("A"));
    a.add(id("B"));
    ReachedTargets b;
    b.add(id("B"));
    b.add(id("C"));

    a.merge(b);
    EXPECT_EQ(a.size(), 3u);
    EXPECT_EQ(a.sorted_ids(), ids({"A", "B", "C"}));
}

TEST(ReachedTargetAggregatorTest, RecordsOnlyConfiguredTargets) {
    TargetSpec spec = parse_target_spec("S", "A,B");
    ReachedTargetAggregator aggregator(spec);
    aggregator.before_superstep(ReachedTargets());

    aggregator.record(id("X"));
    aggregator.record(id("A"));
    EXPECT_EQ(aggregator.replica().size(), 1u);
    EXPECT_TRUE(aggregator.after_superstep().contains(id("A")));
    // Local discoveries are not part of the installed global value
    EXPECT_TRUE(aggregator.global().empty());
}

TEST(ReachedTargetAggregatorTest, AllModeTracksNothing) {
    TargetSpec spec = parse_target_spec("S", "*");
    ReachedTargetAggregator aggregator(spec);
    aggregator.before_superstep(ReachedTargets());
    aggregator.record(id("A"));
    EXPECT_TRUE(aggregator.after_superstep().empty());
    EXPECT_FALSE(aggregator.is_all_targets_reached(id("A")));
    EXPECT_FALSE(aggregator.all_targets_reached());
}

TEST(ReachedTargetAggregatorTest, BeforeSuperstepReplacesReplica) {
    TargetSpec spec = parse_target_spec("S", "A,B");
    ReachedTargetAggregator aggregator(spec);
    aggregator.before_superstep(ReachedTargets());
    aggregator.record(id("A"));

    ReachedTargets global;
    global.add(id("A"));
    global.add(id("B"));
    aggregator.before_superstep(global);
    EXPECT_EQ(aggregator.replica().size(), 2u);
    EXPECT_TRUE(aggregator.all_targets_reached());
}

TEST(ReachedTargetAggregatorTest, SingleIsReachedOnlyAtTheTarget) {
    TargetSpec spec = parse_target_spec("S", "T");
    ReachedTargetAggregator aggregator(spec);
    aggregator.before_superstep(ReachedTargets());
    EXPECT_TRUE(aggregator.is_all_targets_reached(id("T")));
    EXPECT_FALSE(aggregator.is_all_targets_reached(id("X")));
}

TEST(ReachedTargetAggregatorTest, MultipleNeedsEveryTarget) {
    TargetSpec spec = parse_target_spec("S", "A,B,C");
    ReachedTargetAggregator aggregator(spec);

    ReachedTargets global;
    global.add(id("A"));
    aggregator.before_superstep(global);
    EXPECT_FALSE(aggregator.is_all_targets_reached(id("B")));
    EXPECT_FALSE(aggregator.all_targets_reached());

    global.add(id("B"));
    aggregator.before_superstep(global);
    // C counts itself
    EXPECT_TRUE(aggregator.is_all_targets_reached(id("C")));
    EXPECT_FALSE(aggregator.is_all_targets_reached(id("A")));
    EXPECT_FALSE(aggregator.all_targets_reached());

    global.add(id("C"));
    aggregator.before_superstep(global);
    EXPECT_TRUE(aggregator.is_all_targets_reached(id("A")));
    EXPECT_TRUE(aggregator.all_targets_reached());
}
