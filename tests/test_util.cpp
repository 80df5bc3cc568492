/**
 * @file test_util.cpp
 * @brief Tests for utility functions
 */

#include <gtest/gtest.h>
#include "permforge/Util.hpp"

using namespace permforge;
using nlohmann::json;

// ============================================================================
// Dot paths
// ============================================================================

TEST(DotPath, SetCreatesIntermediateObjects) {
    json obj = json::object();
    set_by_dot(obj, "backend.default_world", "survival");
    EXPECT_EQ(obj["backend"]["default_world"], "survival");
}

TEST(DotPath, GetAndExists) {
    json obj = {{"backend", {{"negation", false}}}};
    EXPECT_TRUE(exists_by_dot(obj, "backend.negation"));
    EXPECT_FALSE(exists_by_dot(obj, "backend.missing"));
    EXPECT_EQ(get_by_dot(obj, "backend.negation"), false);
    EXPECT_THROW(get_by_dot(obj, "backend.missing"), std::out_of_range);
}

TEST(DeepMerge, NestedObjectsMerged) {
    json base = {{"backend", {{"default_world", "world"}, {"negation", nullptr}}}};
    deep_merge(base, json{{"backend", {{"negation", true}}}});
    EXPECT_EQ(base["backend"]["default_world"], "world");
    EXPECT_EQ(base["backend"]["negation"], true);
}

// ============================================================================
// Strings
// ============================================================================

TEST(Strings, CaseHelpers) {
    EXPECT_EQ(to_lower("WorldEdit.Wand"), "worldedit.wand");
    EXPECT_TRUE(iequals("Admins", "ADMINS"));
    EXPECT_FALSE(iequals("Admins", "Admin"));
    EXPECT_TRUE(iless("admins", "Builders"));
    EXPECT_FALSE(iless("Builders", "admins"));
}

TEST(Strings, SplitAndJoin) {
    std::vector<std::string> parts{"a", "b", "c"};
    EXPECT_EQ(split("a,b,c", ','), parts);
    EXPECT_EQ(join(parts, " "), "a b c");
}

TEST(Strings, Substitute) {
    EXPECT_EQ(substitute("lp group {group} parent add {parent}",
                         {{"group", "Admins"}, {"parent", "Moderators"}}),
              "lp group Admins parent add Moderators");
}

TEST(Strings, SubstituteKeepsUnknownPlaceholders) {
    EXPECT_EQ(substitute("{group} {other}", {{"group", "A"}}), "A {other}");
    EXPECT_EQ(substitute("open { brace", {}), "open { brace");
}

// ============================================================================
// Environment values
// ============================================================================

TEST(ParseJsonOrString, TypedValues) {
    EXPECT_EQ(parse_json_or_string("true"), true);
    EXPECT_EQ(parse_json_or_string("12"), 12);
    EXPECT_EQ(parse_json_or_string("[\"a\",\"b\"]"), json::array({"a", "b"}));
}

TEST(ParseJsonOrString, FallsBackToString) {
    EXPECT_EQ(parse_json_or_string("pve23"), "pve23");
    EXPECT_EQ(parse_json_or_string("LuckPerms"), "LuckPerms");
}
