/**
 * @file test_convert.cpp
 * @brief Tests for bPermissions import and per-stem export
 */

#include <gtest/gtest.h>
#include "permforge/Convert.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Merge.hpp"

using namespace permforge;

namespace {

CombinedTree tree(const Value& doc) {
    return merge({Module::from_value(doc, "test.yml")});
}

std::vector<Module> values(const std::map<std::string, Module>& modules) {
    std::vector<Module> out;
    for (const auto& entry : modules) out.push_back(entry.second);
    return out;
}

const Value kServerDoc = {
    {"groups", {
        {"Moderators", Value::array({"default"})},
        {"Admins", Value::array({"Moderators"})}
    }},
    {"weights", {{"Moderators", 10}, {"Admins", 20}}},
    {"permissions", {
        {"default", Value::array({"chat.talk", "worldedit.wand"})},
        {"Moderators", Value::array({"chat.mute", "^WorldEdit.wand"})},
        {"Admins", Value::array({"chat.talk", "worldedit.wand", "essentials"})}
    }}
};

} // namespace

// ============================================================================
// Export
// ============================================================================

TEST(ExportByStem, OneModulePerStem) {
    auto modules = export_by_stem(tree(kServerDoc));

    ASSERT_EQ(modules.size(), 3u);
    EXPECT_EQ(modules.count("chat"), 1u);
    EXPECT_EQ(modules.count("essentials"), 1u);
    EXPECT_EQ(modules.count("worldedit"), 1u);

    const Module& worldedit = modules.at("worldedit");
    EXPECT_EQ(worldedit.permissions.at("Moderators"), std::vector<std::string>{"^WorldEdit.wand"});
    EXPECT_EQ(worldedit.permissions.at("default"), std::vector<std::string>{"worldedit.wand"});
}

TEST(ExportByStem, GroupsAndWeightsInOneModule) {
    auto modules = export_by_stem(tree(kServerDoc));

    int with_groups = 0;
    int with_weights = 0;
    for (const auto& [name, module] : modules) {
        with_groups += module.has_groups ? 1 : 0;
        with_weights += module.has_weights ? 1 : 0;
    }
    EXPECT_EQ(with_groups, 1);
    EXPECT_EQ(with_weights, 1);
    EXPECT_TRUE(modules.at("chat").has_groups);
}

TEST(ExportByStem, RemergeReconstructsTree) {
    CombinedTree original = tree(kServerDoc);
    CombinedTree remerged = merge(values(export_by_stem(original)));
    EXPECT_EQ(remerged, original);
}

TEST(ExportByStem, NoPermissionsUsesGroupsModule) {
    auto modules = export_by_stem(tree({{"groups", {{"Admins", Value::array({"Moderators"})}}}}));
    ASSERT_EQ(modules.size(), 1u);
    ASSERT_EQ(modules.count(kGroupsModuleName), 1u);
    EXPECT_TRUE(modules.at(kGroupsModuleName).has_groups);
}

TEST(ExportByStem, EmptyTree) {
    auto modules = export_by_stem(CombinedTree{});
    ASSERT_EQ(modules.size(), 1u);
    EXPECT_TRUE(modules.at(kGroupsModuleName).groups.empty());
}

TEST(ExportByStem, EmptyStemUsesGroupsModule) {
    CombinedTree original = tree({
        {"groups", {{"Admins", Value::array({"Moderators"})}}},
        {"weights", {{"Admins", 20}}},
        {"permissions", {{"Admins", Value::array({".foo", "^.bar", "chat.talk"})}}}
    });
    auto modules = export_by_stem(original);

    ASSERT_EQ(modules.size(), 2u);
    ASSERT_EQ(modules.count(""), 0u);
    const Module& holder = modules.at(kGroupsModuleName);
    EXPECT_EQ(holder.permissions.at("Admins"), (std::vector<std::string>{".foo", "^.bar"}));
    EXPECT_TRUE(holder.has_groups);
    EXPECT_EQ(holder.weights.at("Admins"), 20);
    EXPECT_FALSE(modules.at("chat").has_groups);

    EXPECT_EQ(merge(values(modules)), original);
}

TEST(ExportByStem, PathSeparatorInStemRejected) {
    CombinedTree original = tree({{"permissions", {{"Admins", Value::array({"evil/../x.y"})}}}});
    EXPECT_THROW(export_by_stem(original), PermError);
}

TEST(ExportByStem, PruneInherited) {
    std::vector<std::string> notes;
    ExportOptions options;
    options.prune_inherited = true;
    auto modules = export_by_stem(tree(kServerDoc), options, &notes);

    // Admins inherits chat.talk from default through Moderators.
    const Module& chat = modules.at("chat");
    EXPECT_EQ(chat.permissions.count("Admins"), 0u);

    // Moderators negates worldedit.wand, so Admins must keep its own grant.
    const Module& worldedit = modules.at("worldedit");
    EXPECT_EQ(worldedit.permissions.at("Admins"), std::vector<std::string>{"worldedit.wand"});

    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("chat.talk"), std::string::npos);
    EXPECT_NE(notes[0].find("default"), std::string::npos);
}

// ============================================================================
// Import
// ============================================================================

TEST(ImportBPermissions, GroupsAndPermissions) {
    Value dump = {{"groups", {
        {"admins", {
            {"permissions", Value::array({"^bukkit.command.stop", "worldedit.*"})},
            {"groups", Value::array({"moderators"})}
        }},
        {"moderators", {{"permissions", Value::array({"Chat.Mute"})}}}
    }}};

    auto modules = import_bpermissions(dump, "groups.yml");
    ASSERT_EQ(modules.size(), 1u);
    const Module& m = modules[0];

    EXPECT_EQ(m.groups.at("admins"), std::vector<std::string>{"moderators"});
    EXPECT_TRUE(m.groups.at("moderators").empty());
    std::vector<std::string> admin_nodes{"^bukkit.command.stop", "worldedit.*"};
    EXPECT_EQ(m.permissions.at("admins"), admin_nodes);
    EXPECT_EQ(m.permissions.at("moderators"), std::vector<std::string>{"Chat.Mute"});

    CombinedTree merged = merge(modules);
    EXPECT_EQ(merged.groups.size(), 2u);
}

TEST(ImportBPermissions, EmptyDump) {
    auto modules = import_bpermissions(Value(nullptr), "groups.yml");
    ASSERT_EQ(modules.size(), 1u);
    EXPECT_TRUE(modules[0].groups.empty());
}

TEST(ImportBPermissions, BadShape) {
    Value dump = {{"groups", {{"admins", {{"permissions", "not-a-list"}}}}}};
    try {
        import_bpermissions(dump, "groups.yml");
        FAIL() << "Expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.path(), "groups.admins.permissions");
    }
}
