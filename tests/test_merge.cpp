/**
 * @file test_merge.cpp
 * @brief Tests for module merging using Google Test
 */

#include <gtest/gtest.h>
#include "permforge/Errors.hpp"
#include "permforge/Merge.hpp"

using namespace permforge;

namespace {

Module module(const Value& doc, const std::string& source = "test.yml") {
    return Module::from_value(doc, source);
}

std::vector<std::string> nodes(std::initializer_list<const char*> items) {
    return std::vector<std::string>(items.begin(), items.end());
}

} // namespace

// ============================================================================
// Simple merges
// ============================================================================

TEST(Merge, NoModules) {
    CombinedTree tree = merge({});
    EXPECT_TRUE(tree.groups.empty());
    EXPECT_TRUE(tree.weights.empty());
    EXPECT_TRUE(tree.permissions.empty());
}

TEST(Merge, EveryKnownGroupHasEntries) {
    CombinedTree tree = merge({module({
        {"groups", {{"Admins", Value::array({"Moderators"})}}},
        {"weights", {{"Builders", 5}}}
    })});

    for (const char* name : {"Admins", "Moderators", "Builders"}) {
        EXPECT_EQ(tree.groups.count(GroupName(name)), 1u) << name;
        EXPECT_EQ(tree.permissions.count(GroupName(name)), 1u) << name;
    }
    EXPECT_TRUE(tree.groups.at("Moderators").empty());
}

TEST(Merge, EndToEndPermissions) {
    Module a = module({{"permissions", {
        {"default", Value::array({"aplugin.player"})},
        {"Moderators", Value::array({"aplugin.staff"})}
    }}}, "a.yml");
    Module b = module({{"permissions", {
        {"default", Value::array({"bplugin.player"})},
        {"Admins", Value::array({"bplugin.*"})}
    }}}, "b.yml");

    CombinedTree tree = merge({a, b});

    std::map<GroupName, std::vector<std::string>> expected = {
        {"default", nodes({"aplugin.player", "bplugin.player"})},
        {"Moderators", nodes({"aplugin.staff"})},
        {"Admins", nodes({"bplugin.*"})}
    };
    EXPECT_EQ(tree.permissions, expected);
}

TEST(Merge, PermissionsSortedCaseInsensitively) {
    CombinedTree tree = merge({
        module({{"permissions", {{"G", Value::array({"zeta.a", "Beta.b"})}}}}),
        module({{"permissions", {{"G", Value::array({"alpha.c", "beta.B"})}}}})
    });
    EXPECT_EQ(tree.permissions.at("G"), nodes({"alpha.c", "Beta.b", "zeta.a"}));
}

TEST(Merge, ParentsAppendedWithoutDuplicates) {
    CombinedTree tree = merge({
        module({{"groups", {{"Admins", Value::array({"Moderators"})}}}}),
        module({{"groups", {{"Admins", Value::array({"Builders", "Moderators"})}}}})
    });
    std::vector<GroupName> expected{"Moderators", "Builders"};
    EXPECT_EQ(tree.groups.at("Admins"), expected);
}

// ============================================================================
// Weights: last write wins
// ============================================================================

TEST(Merge, WeightsLastWriteWins) {
    Module a = module({{"weights", {{"Admins", 10}}}}, "a.yml");
    Module b = module({{"weights", {{"Admins", 20}}}}, "b.yml");

    EXPECT_EQ(merge({a, b}).weights.at("Admins"), 20);
    EXPECT_EQ(merge({b, a}).weights.at("Admins"), 10);
}

TEST(Merge, PermissionsIndependentOfPartition) {
    Module a = module({{"permissions", {{"G", Value::array({"a.one"})}}}});
    Module b = module({{"permissions", {{"G", Value::array({"b.two"})}, {"H", Value::array({"b.x"})}}}});
    Module c = module({{"permissions", {{"G", Value::array({"A.ONE", "c.three"})}}}});

    CombinedTree all = merge({a, b, c});

    CombinedTree staged = merge({a, b});
    merge_into(staged, c);
    EXPECT_EQ(staged.permissions, all.permissions);

    CombinedTree split = merge({a});
    merge_into(split, b);
    merge_into(split, c);
    EXPECT_EQ(split.permissions, all.permissions);
}

// ============================================================================
// Letter case
// ============================================================================

TEST(Merge, CaseConflictAcrossModules) {
    Module a = module({{"permissions", {{"Admins", Value::array({"a.b"})}}}});
    Module b = module({{"permissions", {{"ADMINS", Value::array({"c.d"})}}}});
    try {
        merge({a, b});
        FAIL() << "Expected CaseConflictError";
    } catch (const CaseConflictError& e) {
        EXPECT_EQ(e.first(), "Admins");
        EXPECT_EQ(e.second(), "ADMINS");
    }
}

TEST(Merge, CaseConflictWithinModule) {
    Module m = module({{"groups", {{"Admins", Value::array({"moderators"})},
                                   {"Moderators", Value::array()}}}});
    EXPECT_THROW(merge({m}), CaseConflictError);
}

TEST(Merge, CaseConflictLeavesTreeUnchanged) {
    CombinedTree tree = merge({module({{"weights", {{"Admins", 10}}}})});
    CombinedTree before = tree;
    Module bad = module({{"weights", {{"Builders", 3}, {"admins", 20}}}});
    EXPECT_THROW(merge_into(tree, bad), CaseConflictError);
    EXPECT_EQ(tree, before);
}

TEST(Merge, IdenticalSpellingUnions) {
    CombinedTree tree = merge({
        module({{"permissions", {{"Admins", Value::array({"a.b"})}}}}),
        module({{"permissions", {{"Admins", Value::array({"c.d"})}}}})
    });
    EXPECT_EQ(tree.permissions.at("Admins"), nodes({"a.b", "c.d"}));
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(Merge, WarnsAboutUnknownKeys) {
    std::vector<std::string> warnings;
    merge({module({{"permisions", Value::object()}}, "typo.yml")}, &warnings);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("typo.yml"), std::string::npos);
    EXPECT_NE(warnings[0].find("permisions"), std::string::npos);
}

TEST(Merge, TreeToModuleRemergesIdentically) {
    CombinedTree tree = merge({
        module({{"groups", {{"Admins", Value::array({"Moderators"})}}},
                {"weights", {{"Admins", 30}, {"Moderators", 20}}},
                {"permissions", {{"Admins", Value::array({"^a.b", "c.d"})}}}})
    });
    EXPECT_EQ(merge({tree_to_module(tree, "roundtrip")}), tree);
}
