/**
 * @file test_classify.cpp
 * @brief Unit tests for leaf classification (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jsonbuilder/Classify.hpp"
#include "jsonbuilder/Errors.hpp"

using namespace jsonbuilder;

// ============================================================================
// classify
// ============================================================================

TEST(Classify, NullIsNull) {
    EXPECT_EQ(classify(Node(nullptr)), LeafKind::Null);
}

TEST(Classify, ScalarsAreLiterals) {
    EXPECT_EQ(classify(Node("John")), LeafKind::Literal);
    EXPECT_EQ(classify(Node(42)), LeafKind::Literal);
    EXPECT_EQ(classify(Node(3.5)), LeafKind::Literal);
    EXPECT_EQ(classify(Node(false)), LeafKind::Literal);
    EXPECT_EQ(classify(Node("")), LeafKind::Literal);
}

TEST(Classify, BraceInStringIsEmbeddedJson) {
    EXPECT_EQ(classify(Node("{\"facebook\": \"url\"}")), LeafKind::EmbeddedJsonText);
    EXPECT_EQ(classify(Node("  {\"a\":1}  ")), LeafKind::EmbeddedJsonText);
    // Substring check, not a structural one
    EXPECT_EQ(classify(Node("see {here}")), LeafKind::EmbeddedJsonText);
}

TEST(Classify, ArrayTextWithoutBraceIsLiteral) {
    EXPECT_EQ(classify(Node("[1, 2]")), LeafKind::Literal);
}

TEST(Classify, ObjectNodeIsNestedStructure) {
    EXPECT_EQ(classify(Node{{"a", 1}}), LeafKind::NestedStructure);
}

TEST(Classify, MappingIsNestedStructure) {
    EXPECT_EQ(classify(Mapping{}), LeafKind::NestedStructure);
}

TEST(LeafKindName, Names) {
    EXPECT_STREQ(leaf_kind_name(LeafKind::EmbeddedJsonText), "embedded-json-text");
    EXPECT_STREQ(leaf_kind_name(LeafKind::NestedStructure), "nested-structure");
}

// ============================================================================
// resolve_leaf
// ============================================================================

class ResolveLeafTest : public ::testing::Test {
protected:
    JsonCodec codec;
};

TEST_F(ResolveLeafTest, NullStaysExplicitNull) {
    Node leaf = resolve_leaf(Node(nullptr), codec);
    EXPECT_TRUE(leaf.is_null());
}

TEST_F(ResolveLeafTest, LiteralIsUnchanged) {
    EXPECT_EQ(resolve_leaf(Node("Doe"), codec), "Doe");
    EXPECT_EQ(resolve_leaf(Node(7), codec), 7);
}

TEST_F(ResolveLeafTest, EmbeddedJsonIsDecoded) {
    Node leaf = resolve_leaf(Node("{\"facebook\": \"url\"}"), codec);
    ASSERT_TRUE(leaf.is_object());
    EXPECT_EQ(leaf["facebook"], "url");
}

TEST_F(ResolveLeafTest, MalformedEmbeddedJsonRaisesDecodeError) {
    EXPECT_THROW(resolve_leaf(Node("{oops"), codec), DecodeError);
    EXPECT_THROW(resolve_leaf(Node("see {here}"), codec), DecodeError);
}

TEST_F(ResolveLeafTest, EmbeddedNonObjectRaisesDecodeError) {
    try {
        resolve_leaf(Node("[{\"a\":1}]"), codec);
        FAIL() << "Should have thrown DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.text(), "[{\"a\":1}]");
        EXPECT_NE(e.details().find("array"), std::string::npos);
    }
}

TEST_F(ResolveLeafTest, DecodeErrorIsABuildError) {
    EXPECT_THROW(resolve_leaf(Node("{oops"), codec), BuildError);
}

TEST_F(ResolveLeafTest, ObjectNodeIsCopied) {
    Node source = {{"a", 1}};
    Node leaf = resolve_leaf(source, codec);
    leaf["a"] = 2;
    EXPECT_EQ(source["a"], 1);
}

TEST_F(ResolveLeafTest, MappingBecomesObject) {
    Mapping map = {{"name", std::string("John")}, {"age", std::int64_t{30}}};
    Node leaf = resolve_leaf(map, codec);
    ASSERT_TRUE(leaf.is_object());
    EXPECT_EQ(leaf["name"], "John");
    EXPECT_EQ(leaf["age"], 30);
}
