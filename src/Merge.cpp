/**
 * @file Merge.cpp
 * @brief Implementation of module merging
 */

#include "permforge/Merge.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Util.hpp"

#include <algorithm>
#include <map>

namespace permforge {

namespace {

/**
 * @brief Tracks the one accepted spelling of every group name
 */
class NameRegistry {
public:
    NameRegistry() = default;

    explicit NameRegistry(const GroupTree& tree) {
        for (const auto& group : tree.known_groups()) {
            spellings_.emplace(group.canonical(), group.str());
        }
    }

    GroupName intern(const std::string& name) {
        GroupName group(name);
        auto [it, inserted] = spellings_.emplace(group.canonical(), name);
        if (!inserted && it->second != name) {
            throw CaseConflictError(it->second, name);
        }
        return group;
    }

private:
    std::map<std::string, std::string> spellings_;
};

void warn_unknown_keys(const Module& module, std::vector<std::string>* warnings) {
    if (warnings == nullptr || module.unknown_keys.empty()) return;
    warnings->push_back("unexpected YAML keys in " + module.source + ": " +
                        join(module.unknown_keys, " "));
}

} // anonymous namespace

void merge_into(CombinedTree& tree, const Module& module, std::vector<std::string>* warnings) {
    warn_unknown_keys(module, warnings);

    // Check every mention before touching the tree, so a conflict leaves it unchanged.
    NameRegistry names(tree);
    for (const auto& [group, parents] : module.groups) {
        names.intern(group);
        for (const auto& parent : parents) names.intern(parent);
    }
    for (const auto& entry : module.weights) names.intern(entry.first);
    for (const auto& entry : module.permissions) names.intern(entry.first);

    for (const auto& [group, parents] : module.groups) {
        auto& merged = tree.groups[GroupName(group)];
        for (const auto& parent : parents) {
            GroupName name(parent);
            if (std::find(merged.begin(), merged.end(), name) == merged.end()) {
                merged.push_back(name);
            }
            tree.groups[name];
        }
    }

    for (const auto& [group, weight] : module.weights) {
        tree.weights[GroupName(group)] = weight;
    }

    for (const auto& [group, nodes] : module.permissions) {
        auto& merged = tree.permissions[GroupName(group)];
        merged.insert(merged.end(), nodes.begin(), nodes.end());
        merged = normalize_nodes(std::move(merged));
    }

    // Every known group gets an entry in groups and permissions.
    for (const auto& group : tree.known_groups()) {
        tree.groups[group];
        tree.permissions[group];
    }
}

void check_group_spelling(const std::vector<const GroupTree*>& trees) {
    NameRegistry names;
    for (const auto* tree : trees) {
        for (const auto& group : tree->known_groups()) names.intern(group.str());
    }
}

CombinedTree merge(const std::vector<Module>& modules, std::vector<std::string>* warnings) {
    CombinedTree tree;
    for (const auto& module : modules) {
        merge_into(tree, module, warnings);
    }
    return tree;
}

} // namespace permforge
