#include "errors.hpp"
#include "target_spec.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

TEST(TargetSpecTest, BlankSourceOrTargetIsConfigError) {
    EXPECT_THROW(parse_target_spec("", "B"), ConfigError);
    EXPECT_THROW(parse_target_spec("   ", "B"), ConfigError);
    EXPECT_THROW(parse_target_spec("S", ""), ConfigError);
    EXPECT_THROW(parse_target_spec("S", " \t"), ConfigError);
}

TEST(TargetSpecTest, WildcardMeansAllWithNoTargetIds) {
    TargetSpec spec = parse_target_spec("S", " * ");
    EXPECT_EQ(spec.quantity, QuantityType::ALL);
    EXPECT_TRUE(spec.target_ids.empty());
    EXPECT_EQ(spec.source_id, id("S"));
    EXPECT_FALSE(spec.is_target(id("*")));
}

TEST(TargetSpecTest, OneIdIsSingle) {
    TargetSpec spec = parse_target_spec("1", "2");
    EXPECT_EQ(spec.quantity, QuantityType::SINGLE);
    EXPECT_EQ(spec.single_target(), VertexId::of_long(2));
    EXPECT_EQ(spec.source_id, VertexId::of_long(1));
}

TEST(TargetSpecTest, SeveralIdsAreMultipleAndTrimmed) {
    TargetSpec spec = parse_target_spec("S", "A , B,C ");
    EXPECT_EQ(spec.quantity, QuantityType::MULTIPLE);
    EXPECT_EQ(spec.target_ids.size(), 3u);
    EXPECT_TRUE(spec.is_target(id("A")));
    EXPECT_TRUE(spec.is_target(id("B")));
    EXPECT_TRUE(spec.is_target(id("C")));
    EXPECT_THROW(spec.single_target(), std::logic_error);
}

TEST(TargetSpecTest, DuplicatesCollapseBeforeClassification) {
    TargetSpec spec = parse_target_spec("S", "A,A, A");
    EXPECT_EQ(spec.quantity, QuantityType::SINGLE);
    EXPECT_EQ(spec.target_ids.size(), 1u);
}

TEST(TargetSpecTest, MixedEncodingsAreDistinctTargets) {
    TargetSpec spec = parse_target_spec("S", "7,\"7\"");
    EXPECT_EQ(spec.quantity, QuantityType::MULTIPLE);
    EXPECT_TRUE(spec.is_target(VertexId::of_long(7)));
    EXPECT_TRUE(spec.is_target(VertexId::of_string("7")));
}

TEST(TargetSpecTest, MalformedListsAreRejected) {
    EXPECT_THROW(parse_target_spec("S", "A,,B"), ConfigError);
    EXPECT_THROW(parse_target_spec("S", "A,"), ConfigError);
    EXPECT_THROW(parse_target_spec("S", ",A"), ConfigError);
    EXPECT_THROW(parse_target_spec("S", "A,*"), ConfigError);
    EXPECT_THROW(parse_target_spec("S,T", "A"), ConfigError);
}

TEST(TargetSpecTest, ErrorNamesTheOption) {
    try {
        parse_target_spec("S", "");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("target_id"), std::string::npos);
    }
}

TEST(TargetSpecTest, QuotedIdsKeepTheirCommas) {
    TargetSpec spec = parse_target_spec("\"x,y\"", "\"a,b\"");
    EXPECT_EQ(spec.source_id, VertexId::of_string("x,y"));
    EXPECT_EQ(spec.quantity, QuantityType::SINGLE);
    EXPECT_EQ(spec.single_target(), VertexId::of_string("a,b"));

    TargetSpec several = parse_target_spec("S", "\"a,b\", c");
    EXPECT_EQ(several.quantity, QuantityType::MULTIPLE);
    EXPECT_TRUE(several.is_target(VertexId::of_string("a,b")));
    EXPECT_TRUE(several.is_target(id("c")));
}

TEST(TargetSpecTest, UnterminatedQuoteIsConfigError) {
    EXPECT_THROW(parse_target_spec("S", "\"a"), ConfigError);
    EXPECT_THROW(parse_target_spec("S", "b,\"a,c"), ConfigError);
    EXPECT_THROW(parse_target_spec("\"S", "A"), ConfigError);
}
