/**
 * @file Model.cpp
 * @brief Module parsing and node helpers
 */

#include "permforge/Model.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Util.hpp"

#include <algorithm>

namespace permforge {

const char* const kDefaultContext = "default";

bool is_default_context(const std::string& world) {
    return world.empty() || world == kDefaultContext;
}

GroupName::GroupName(std::string name)
    : original_(std::move(name))
    , canonical_(to_lower(original_))
{}

// ============================================================================
// Permission nodes
// ============================================================================

bool is_negated(const std::string& node) {
    return !node.empty() && node.front() == kNegationMarker;
}

std::string strip_negation(const std::string& node) {
    return is_negated(node) ? node.substr(1) : node;
}

std::string node_stem(const std::string& node) {
    std::string text = strip_negation(node);
    auto pos = text.find(kNamespaceSeparator);
    return to_lower(pos == std::string::npos ? text : text.substr(0, pos));
}

bool node_less(const std::string& a, const std::string& b) {
    return iless(a, b);
}

bool node_equal(const std::string& a, const std::string& b) {
    return iequals(a, b);
}

std::vector<std::string> normalize_nodes(std::vector<std::string> nodes) {
    std::stable_sort(nodes.begin(), nodes.end(), node_less);
    nodes.erase(std::unique(nodes.begin(), nodes.end(), node_equal), nodes.end());
    return nodes;
}

bool same_node_set(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::set<std::string> lhs;
    std::set<std::string> rhs;
    for (const auto& node : a) lhs.insert(to_lower(node));
    for (const auto& node : b) rhs.insert(to_lower(node));
    return lhs == rhs;
}

// ============================================================================
// Module
// ============================================================================

namespace {

const char* const kGroupsKey = "groups";
const char* const kWeightsKey = "weights";
const char* const kPermissionsKey = "permissions";

std::vector<std::string> string_list(const Value& v, const std::string& source,
                                     const std::string& path) {
    if (!v.is_array()) {
        throw SchemaError(source, path, "expected a list, got " + type_name(v));
    }
    std::vector<std::string> out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        if (!v[i].is_string()) {
            throw SchemaError(source, path + "[" + std::to_string(i) + "]",
                              "expected a string, got " + type_name(v[i]));
        }
        out.push_back(v[i].get<std::string>());
    }
    return out;
}

const Value& section(const Value& doc, const char* key, const std::string& source) {
    const Value& v = doc.at(key);
    if (!v.is_object() && !v.is_null()) {
        throw SchemaError(source, key, "expected a mapping, got " + type_name(v));
    }
    return v;
}

} // anonymous namespace

Module Module::from_value(const Value& doc, const std::string& source) {
    Module module;
    module.source = source;

    if (doc.is_null()) {
        return module;
    }
    if (!doc.is_object()) {
        throw SchemaError(source, "<root>", "expected a mapping, got " + type_name(doc));
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const auto& key = it.key();
        if (key != kGroupsKey && key != kWeightsKey && key != kPermissionsKey) {
            module.unknown_keys.push_back(key);
        }
    }

    if (doc.contains(kGroupsKey)) {
        module.has_groups = true;
        const Value& groups = section(doc, kGroupsKey, source);
        if (groups.is_object()) {
            for (auto it = groups.begin(); it != groups.end(); ++it) {
                module.groups[it.key()] =
                    string_list(it.value(), source, std::string(kGroupsKey) + "." + it.key());
            }
        }
    }

    if (doc.contains(kWeightsKey)) {
        module.has_weights = true;
        const Value& weights = section(doc, kWeightsKey, source);
        if (weights.is_object()) {
            for (auto it = weights.begin(); it != weights.end(); ++it) {
                if (!it.value().is_number_integer()) {
                    throw SchemaError(source, std::string(kWeightsKey) + "." + it.key(),
                                      "expected an integer, got " + type_name(it.value()));
                }
                module.weights[it.key()] = it.value().get<std::int64_t>();
            }
        }
    }

    if (doc.contains(kPermissionsKey)) {
        module.has_permissions = true;
        const Value& permissions = section(doc, kPermissionsKey, source);
        if (permissions.is_object()) {
            for (auto it = permissions.begin(); it != permissions.end(); ++it) {
                module.permissions[it.key()] =
                    string_list(it.value(), source, std::string(kPermissionsKey) + "." + it.key());
            }
        }
    }

    return module;
}

Value Module::to_value() const {
    Value doc = Value::object();
    if (has_groups) {
        Value& out = doc[kGroupsKey] = Value::object();
        for (const auto& [group, parents] : groups) out[group] = parents;
    }
    if (has_weights) {
        Value& out = doc[kWeightsKey] = Value::object();
        for (const auto& [group, weight] : weights) out[group] = weight;
    }
    if (has_permissions) {
        Value& out = doc[kPermissionsKey] = Value::object();
        for (const auto& [group, nodes] : permissions) out[group] = nodes;
    }
    return doc;
}

bool Module::operator==(const Module& other) const {
    return groups == other.groups && weights == other.weights &&
           permissions == other.permissions && has_groups == other.has_groups &&
           has_weights == other.has_weights && has_permissions == other.has_permissions;
}

// ============================================================================
// Trees
// ============================================================================

std::set<GroupName> GroupTree::known_groups() const {
    std::set<GroupName> known;
    for (const auto& [group, parents] : groups) {
        known.insert(group);
        known.insert(parents.begin(), parents.end());
    }
    for (const auto& entry : weights) known.insert(entry.first);
    for (const auto& entry : permissions) known.insert(entry.first);
    return known;
}

Module tree_to_module(const CombinedTree& tree, const std::string& source) {
    Module module;
    module.source = source;
    module.has_groups = true;
    module.has_weights = !tree.weights.empty();
    module.has_permissions = true;
    for (const auto& [group, parents] : tree.groups) {
        auto& out = module.groups[group.str()];
        for (const auto& parent : parents) out.push_back(parent.str());
    }
    for (const auto& [group, weight] : tree.weights) {
        module.weights[group.str()] = weight;
    }
    for (const auto& [group, nodes] : tree.permissions) {
        module.permissions[group.str()] = nodes;
    }
    return module;
}

} // namespace permforge
