/**
 * @file Plan.cpp
 * @brief Command planning across contexts
 */

#include "permforge/Plan.hpp"
#include "permforge/Diff.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Graph.hpp"
#include "permforge/Merge.hpp"

namespace permforge {

namespace {

const CombinedTree& context_tree(const ContextTrees& trees, const std::string& world) {
    auto it = trees.find(world);
    if (it == trees.end()) {
        throw LoadError("context \"" + world + "\" has not been loaded");
    }
    return it->second;
}

void check_spelling_across(const ContextTrees& trees) {
    std::vector<const GroupTree*> all;
    // The default context first, so its spelling is the one reported first.
    auto base = trees.find(kDefaultContext);
    if (base != trees.end()) all.push_back(&base->second);
    for (const auto& entry : trees) {
        if (entry.first != kDefaultContext) all.push_back(&entry.second);
    }
    check_group_spelling(all);
}

void append(std::vector<PlannedCommand>& plan, const std::string& world,
            std::vector<Command> commands) {
    for (auto& command : commands) {
        plan.push_back({world, std::move(command)});
    }
}

} // anonymous namespace

ContextTrees merge_contexts(const ContextModules& contexts, std::vector<std::string>* warnings) {
    ContextTrees trees;
    for (const auto& [world, modules] : contexts) {
        trees[world] = merge(modules, warnings);
    }
    check_spelling_across(trees);
    return trees;
}

std::vector<std::string> selected_contexts(const ContextTrees& trees, const std::string& world) {
    std::vector<std::string> selected;
    if (world == kAllWorlds) {
        selected.push_back(kDefaultContext);
        for (const auto& entry : trees) {
            if (!is_default_context(entry.first)) selected.push_back(entry.first);
        }
    } else {
        selected.push_back(is_default_context(world) ? std::string(kDefaultContext) : world);
    }
    for (const auto& name : selected) {
        context_tree(trees, name);
    }
    return selected;
}

std::vector<PlannedCommand> plan_commands(const ContextTrees& trees, const std::string& world,
                                          const Intent& intent, const ProfileTraits& traits,
                                          std::vector<std::string>* warnings) {
    const CombinedTree& base = context_tree(trees, kDefaultContext);
    const auto selected = selected_contexts(trees, world);
    check_spelling_across(trees);

    // A world's delta can hide a cycle that its full tree has.
    for (const auto& name : selected) {
        topological_order(context_tree(trees, name).groups, EdgeDirection::ParentsFirst);
    }

    std::vector<PlannedCommand> plan;
    if (intent.remove) {
        for (const auto& name : selected) {
            append(plan, name, translate(context_tree(trees, name), Intent{true, false}, name,
                                         traits, warnings));
        }
    }
    if (intent.add) {
        for (const auto& name : selected) {
            const CombinedTree& tree = context_tree(trees, name);
            if (is_default_context(name)) {
                append(plan, name, translate(tree, Intent{false, true}, name, traits, warnings));
            } else {
                append(plan, name, translate(diff(base, tree), Intent{false, true}, name,
                                             traits, warnings));
            }
        }
    }
    return plan;
}

} // namespace permforge
