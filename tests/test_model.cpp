/**
 * @file test_model.cpp
 * @brief Tests for group names, node helpers and module parsing
 */

#include <gtest/gtest.h>
#include "permforge/Errors.hpp"
#include "permforge/Model.hpp"

using namespace permforge;

// ============================================================================
// GroupName
// ============================================================================

TEST(GroupName, KeepsOriginalSpelling) {
    GroupName name("Moderators");
    EXPECT_EQ(name.str(), "Moderators");
    EXPECT_EQ(name.canonical(), "moderators");
}

TEST(GroupName, OrdersCaseInsensitively) {
    EXPECT_LT(GroupName("admins"), GroupName("Builders"));
    EXPECT_LT(GroupName("Builders"), GroupName("moderators"));
    EXPECT_FALSE(GroupName("Zed") < GroupName("alpha"));
}

TEST(GroupName, EqualityIsExact) {
    EXPECT_EQ(GroupName("Admins"), GroupName("Admins"));
    EXPECT_NE(GroupName("Admins"), GroupName("ADMINS"));
}

TEST(GroupName, BuiltinDefaultInAnyCase) {
    EXPECT_TRUE(GroupName("default").is_builtin_default());
    EXPECT_TRUE(GroupName("Default").is_builtin_default());
    EXPECT_FALSE(GroupName("defaults").is_builtin_default());
}

TEST(Context, DefaultContextNames) {
    EXPECT_TRUE(is_default_context(""));
    EXPECT_TRUE(is_default_context("default"));
    EXPECT_FALSE(is_default_context("nether"));
}

// ============================================================================
// Permission nodes
// ============================================================================

TEST(Nodes, Negation) {
    EXPECT_TRUE(is_negated("^worldedit.wand"));
    EXPECT_FALSE(is_negated("worldedit.wand"));
    EXPECT_FALSE(is_negated(""));
    EXPECT_EQ(strip_negation("^worldedit.wand"), "worldedit.wand");
    EXPECT_EQ(strip_negation("worldedit.wand"), "worldedit.wand");
}

TEST(Nodes, Stem) {
    EXPECT_EQ(node_stem("bukkit.command.help"), "bukkit");
    EXPECT_EQ(node_stem("^WorldEdit.wand"), "worldedit");
    EXPECT_EQ(node_stem("essentials"), "essentials");
}

TEST(Nodes, NormalizeSortsAndDeduplicates) {
    auto nodes = normalize_nodes({"b.node", "A.node", "a.NODE", "c", "b.node"});
    std::vector<std::string> expected{"A.node", "b.node", "c"};
    EXPECT_EQ(nodes, expected);
}

TEST(Nodes, NegatedFormIsDistinct) {
    auto nodes = normalize_nodes({"x.y", "^x.y"});
    EXPECT_EQ(nodes.size(), 2u);
}

TEST(Nodes, SameNodeSetIgnoresCaseAndOrder) {
    EXPECT_TRUE(same_node_set({"A.b", "c"}, {"c", "a.B"}));
    EXPECT_FALSE(same_node_set({"a.b"}, {"a.b", "c"}));
}

// ============================================================================
// Module::from_value
// ============================================================================

TEST(ModuleFromValue, AllSections) {
    Value doc = {
        {"groups", {{"Admins", Value::array({"Moderators"})}}},
        {"weights", {{"Admins", 30}}},
        {"permissions", {{"Admins", Value::array({"bplugin.*"})}}}
    };
    Module m = Module::from_value(doc, "test.yml");

    EXPECT_TRUE(m.has_groups);
    EXPECT_TRUE(m.has_weights);
    EXPECT_TRUE(m.has_permissions);
    EXPECT_EQ(m.groups.at("Admins"), std::vector<std::string>{"Moderators"});
    EXPECT_EQ(m.weights.at("Admins"), 30);
    EXPECT_EQ(m.permissions.at("Admins"), std::vector<std::string>{"bplugin.*"});
    EXPECT_TRUE(m.unknown_keys.empty());
}

TEST(ModuleFromValue, NullDocumentIsEmpty) {
    Module m = Module::from_value(Value(nullptr), "empty.yml");
    EXPECT_FALSE(m.has_groups);
    EXPECT_TRUE(m.groups.empty());
    EXPECT_EQ(m.source, "empty.yml");
}

TEST(ModuleFromValue, NullSectionIsAllowed) {
    Module m = Module::from_value(Value{{"permissions", nullptr}}, "x");
    EXPECT_TRUE(m.has_permissions);
    EXPECT_TRUE(m.permissions.empty());
}

TEST(ModuleFromValue, RecordsUnknownKeys) {
    Module m = Module::from_value(Value{{"permisions", Value::object()}}, "typo.yml");
    ASSERT_EQ(m.unknown_keys.size(), 1u);
    EXPECT_EQ(m.unknown_keys[0], "permisions");
}

TEST(ModuleFromValue, RootMustBeMapping) {
    EXPECT_THROW(Module::from_value(Value::array(), "x"), SchemaError);
}

TEST(ModuleFromValue, WeightMustBeInteger) {
    Value doc = {{"weights", {{"Admins", "high"}}}};
    try {
        Module::from_value(doc, "w.yml");
        FAIL() << "Expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.source(), "w.yml");
        EXPECT_EQ(e.path(), "weights.Admins");
    }
}

TEST(ModuleFromValue, GroupsMustBeList) {
    Value doc = {{"groups", {{"Admins", "Moderators"}}}};
    EXPECT_THROW(Module::from_value(doc, "x"), SchemaError);
}

TEST(ModuleFromValue, PermissionsMustBeStrings) {
    Value doc = {{"permissions", {{"Admins", Value::array({"a.b", 3})}}}};
    try {
        Module::from_value(doc, "p.yml");
        FAIL() << "Expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.path(), "permissions.Admins[1]");
    }
}

TEST(ModuleFromValue, SectionMustBeMapping) {
    EXPECT_THROW(Module::from_value(Value{{"groups", Value::array({"Admins"})}}, "x"), SchemaError);
}

TEST(ModuleToValue, OnlyPresentSections) {
    Value doc = {{"weights", {{"Admins", 30}}}};
    Module m = Module::from_value(doc, "x");
    EXPECT_EQ(m.to_value(), doc);
}
