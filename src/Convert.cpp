/**
 * @file Convert.cpp
 * @brief Backend dump import and per-stem export
 */

#include "permforge/Convert.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Graph.hpp"

#include <algorithm>

namespace permforge {

const char* const kGroupsModuleName = "GROUPS";

// ============================================================================
// Import
// ============================================================================

namespace {

std::vector<std::string> dump_list(const Value& group, const char* key,
                                   const std::string& source, const std::string& path) {
    if (!group.is_object() || !group.contains(key) || group.at(key).is_null()) {
        return {};
    }
    const Value& list = group.at(key);
    if (!list.is_array()) {
        throw SchemaError(source, path + "." + key, "expected a list, got " + type_name(list));
    }
    std::vector<std::string> out;
    for (size_t i = 0; i < list.size(); ++i) {
        if (!list[i].is_string()) {
            throw SchemaError(source, path + "." + key + "[" + std::to_string(i) + "]",
                              "expected a string, got " + type_name(list[i]));
        }
        out.push_back(list[i].get<std::string>());
    }
    return out;
}

} // anonymous namespace

std::vector<Module> import_bpermissions(const Value& dump, const std::string& source) {
    Module module;
    module.source = source;
    module.has_groups = true;
    module.has_permissions = true;

    if (dump.is_null()) {
        return {module};
    }
    if (!dump.is_object()) {
        throw SchemaError(source, "<root>", "expected a mapping, got " + type_name(dump));
    }
    if (!dump.contains("groups") || dump.at("groups").is_null()) {
        return {module};
    }

    const Value& groups = dump.at("groups");
    if (!groups.is_object()) {
        throw SchemaError(source, "groups", "expected a mapping, got " + type_name(groups));
    }
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        const std::string path = "groups." + it.key();
        if (!it.value().is_object() && !it.value().is_null()) {
            throw SchemaError(source, path, "expected a mapping, got " + type_name(it.value()));
        }
        module.groups[it.key()] = dump_list(it.value(), "groups", source, path);
        module.permissions[it.key()] = dump_list(it.value(), "permissions", source, path);
    }
    return {module};
}

// ============================================================================
// Export
// ============================================================================

namespace {

bool contains_node(const std::vector<std::string>& nodes, const std::string& node) {
    return std::any_of(nodes.begin(), nodes.end(),
                       [&](const std::string& n) { return node_equal(n, node); });
}

std::string inverse_of(const std::string& node) {
    return is_negated(node) ? strip_negation(node) : kNegationMarker + node;
}

/**
 * @brief Name of the nearest ancestor that already grants `node`, or empty
 *
 * Stops at the first ancestor holding either the node or its inverse; an
 * inverse means the group must keep its own copy.
 */
std::string granting_ancestor(const CombinedTree& tree, const GroupName& group,
                              const std::string& node) {
    const std::string inverse = inverse_of(node);
    for (const auto& ancestor : ancestors_of(group, tree.groups)) {
        auto it = tree.permissions.find(ancestor);
        if (it == tree.permissions.end()) continue;
        if (contains_node(it->second, inverse)) return "";
        if (contains_node(it->second, node)) return ancestor.str();
    }
    return "";
}

/**
 * @brief Module file name for a node: its stem, or kGroupsModuleName when
 *        the stem is empty (".foo")
 *
 * @throws PermError if the stem cannot name a file in the output directory
 */
std::string module_name_for(const std::string& node) {
    const std::string stem = node_stem(node);
    if (stem.empty()) {
        return kGroupsModuleName;
    }
    if (stem.find_first_of("/\\") != std::string::npos) {
        throw PermError("permission node '" + node + "' has stem '" + stem +
                        "', which cannot name a module file");
    }
    return stem;
}

} // anonymous namespace

std::map<std::string, Module> export_by_stem(const CombinedTree& tree,
                                             const ExportOptions& options,
                                             std::vector<std::string>* notes) {
    std::map<std::string, Module> modules;

    for (const auto& [group, nodes] : tree.permissions) {
        for (const auto& node : nodes) {
            if (options.prune_inherited) {
                std::string ancestor = granting_ancestor(tree, group, node);
                if (!ancestor.empty()) {
                    if (notes) {
                        notes->push_back("removing redundant permission " + node + " from " +
                                         group.str() + " because it is inherited from " + ancestor);
                    }
                    continue;
                }
            }
            const std::string stem = module_name_for(node);
            Module& module = modules[stem];
            module.source = stem;
            module.has_permissions = true;
            module.permissions[group.str()].push_back(node);
        }
    }

    Module& holder = modules.empty() ? modules[kGroupsModuleName] : modules.begin()->second;
    if (holder.source.empty()) holder.source = kGroupsModuleName;
    holder.has_groups = true;
    for (const auto& [group, parents] : tree.groups) {
        auto& out = holder.groups[group.str()];
        for (const auto& parent : parents) out.push_back(parent.str());
    }
    holder.has_weights = !tree.weights.empty();
    for (const auto& [group, weight] : tree.weights) {
        holder.weights[group.str()] = weight;
    }

    return modules;
}

} // namespace permforge
