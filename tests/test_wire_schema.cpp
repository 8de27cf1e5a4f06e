/**
 * @file test_wire_schema.cpp
 * @brief Tests for the field-index table
 */

#include <geminiweb/wire_schema.hpp>
#include <gtest/gtest.h>

using namespace geminiweb;
using wire::Field;

TEST(WireSchemaTest, KnownPositions) {
    EXPECT_EQ(wire::path(Field::PartPayload), wire::FieldPath({2}));
    EXPECT_EQ(wire::path(Field::BodyCandidates), wire::FieldPath({4}));
    EXPECT_EQ(wire::path(Field::CandidateText), wire::FieldPath({1, 0}));
    EXPECT_EQ(wire::path(Field::CandidateCardText), wire::FieldPath({22, 0}));
    EXPECT_EQ(wire::path(Field::CandidateThoughts), wire::FieldPath({37, 0, 0}));
    EXPECT_EQ(wire::path(Field::CandidateWebImages), wire::FieldPath({12, 1}));
    EXPECT_EQ(wire::path(Field::CandidateGeneratedImages), wire::FieldPath({12, 7, 0}));
    EXPECT_EQ(wire::path(Field::ErrorCode), wire::FieldPath({0, 5, 2, 0, 1, 0}));
    EXPECT_STREQ(wire::field_name(Field::CandidateText), "candidate.text");
}

TEST(WireSchemaTest, LookupWalksNestedArrays) {
    json root = json::parse(R"([0, ["a", ["b", "c"]]])");

    const json* value = wire::lookup(root, wire::FieldPath{1, 1, 0});
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, "b");
}

TEST(WireSchemaTest, LookupToleratesMissingSteps) {
    json root = json::parse(R"([0, null, {"k": 1}])");

    EXPECT_EQ(wire::lookup(root, wire::FieldPath{5}), nullptr);
    EXPECT_EQ(wire::lookup(root, wire::FieldPath{1, 0}), nullptr);
    EXPECT_EQ(wire::lookup(root, wire::FieldPath{2, 0}), nullptr);
    EXPECT_EQ(wire::lookup(root, wire::FieldPath{-4}), nullptr);
}

TEST(WireSchemaTest, NegativeIndexCountsFromEnd) {
    json part = json::parse(R"(["wrb.fr", null, "{}", null, "system"])");

    EXPECT_EQ(wire::string_at(part, Field::PartTag), "system");
}

TEST(WireSchemaTest, StringAtRequiresString) {
    json candidate = json::parse(R"(["rc", [42]])");

    EXPECT_EQ(wire::string_at(candidate, Field::CandidateId), "rc");
    EXPECT_FALSE(wire::string_at(candidate, Field::CandidateText).has_value());
}

TEST(WireSchemaTest, Truthiness) {
    json values = json::parse(R"([null, false, 0, "", [], {}, true, 1, "x", [null], {"a": 1}, 0.5])");

    for (size_t i = 0; i < 6; i++) {
        EXPECT_FALSE(wire::truthy(&values[i])) << values[i].dump();
    }
    for (size_t i = 6; i < values.size(); i++) {
        EXPECT_TRUE(wire::truthy(&values[i])) << values[i].dump();
    }
    EXPECT_FALSE(wire::truthy(nullptr));
}
