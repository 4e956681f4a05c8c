/**
 * @file test_generic.cpp
 * @brief Tests for Node <-> generic mapping conversions
 */

#include <gtest/gtest.h>
#include "jsonbuilder/Errors.hpp"
#include "jsonbuilder/Generic.hpp"
#include <cstdint>
#include <vector>

using namespace jsonbuilder;

TEST(ToMapping, ScalarsKeepTheirTypes) {
    Node doc = Node::parse(R"({"s":"text","i":-3,"u":7,"f":1.5,"b":true,"n":null})");
    Mapping map = to_mapping(doc);

    EXPECT_EQ(std::any_cast<std::string>(map.at("s")), "text");
    EXPECT_EQ(std::any_cast<std::int64_t>(map.at("i")), -3);
    // The parser stores non-negative integers as unsigned
    EXPECT_EQ(std::any_cast<std::uint64_t>(map.at("u")), 7u);
    EXPECT_DOUBLE_EQ(std::any_cast<double>(map.at("f")), 1.5);
    EXPECT_TRUE(std::any_cast<bool>(map.at("b")));
    EXPECT_NO_THROW(std::any_cast<std::nullptr_t>(map.at("n")));
}

TEST(ToMapping, NestedContainers) {
    Node doc = Node::parse(R"({"user":{"friends":["Marco","Polo"]}})");
    Mapping map = to_mapping(doc);

    const auto& user = std::any_cast<const Mapping&>(map.at("user"));
    const auto& friends = std::any_cast<const Sequence&>(user.at("friends"));
    ASSERT_EQ(friends.size(), 2u);
    EXPECT_EQ(std::any_cast<std::string>(friends[0]), "Marco");
    EXPECT_EQ(std::any_cast<std::string>(friends[1]), "Polo");
}

TEST(ToMapping, NonObjectRootRaisesEncodeError) {
    EXPECT_THROW(to_mapping(Node::array()), EncodeError);
    EXPECT_THROW(to_mapping(Node("x")), EncodeError);
}

TEST(ToGeneric, BinaryHasNoGenericForm) {
    Node bin = Node::binary(std::vector<std::uint8_t>{0x01, 0x02});
    EXPECT_THROW(to_generic(bin), EncodeError);
}

TEST(FromGeneric, AcceptsBuiltinWidths) {
    EXPECT_EQ(from_generic(std::any(5)), 5);
    EXPECT_EQ(from_generic(std::any(5L)), 5);
    EXPECT_EQ(from_generic(std::any(5u)), 5);
    EXPECT_EQ(from_generic(std::any(2.5f)), 2.5);
    EXPECT_EQ(from_generic(std::any("lit")), "lit");
    EXPECT_TRUE(from_generic(std::any()).is_null());
    EXPECT_TRUE(from_generic(std::any(nullptr)).is_null());
}

TEST(FromGeneric, UnsupportedTypeRaisesEncodeError) {
    struct Opaque {};
    EXPECT_THROW(from_generic(std::any(Opaque{})), EncodeError);

    Mapping map = {{"bad", std::any(Opaque{})}};
    EXPECT_THROW(from_mapping(map), EncodeError);
}

TEST(FromMapping, RebuildsNestedStructure) {
    Mapping user = {
        {"firstName", std::string("John")},
        {"friends", Sequence{std::string("Marco"), std::string("Polo")}}
    };
    Mapping root = {{"user", user}};

    Node doc = from_mapping(root);
    EXPECT_EQ(doc["user"]["firstName"], "John");
    EXPECT_EQ(doc["user"]["friends"], Node({"Marco", "Polo"}));
}

TEST(FromMapping, RoundTripsBuiltMapping) {
    Node doc = Node::parse(R"({"a":{"b":[1,{"c":null}]},"d":false})");
    EXPECT_EQ(from_mapping(to_mapping(doc)), doc);
}
