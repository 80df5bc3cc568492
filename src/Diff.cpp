/**
 * @file Diff.cpp
 * @brief Implementation of context diffing
 */

#include "permforge/Diff.hpp"

namespace permforge {

namespace {

template <typename Map>
const typename Map::mapped_type* find_value(const Map& map, const GroupName& key) {
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
}

} // anonymous namespace

DeltaTree diff(const CombinedTree& base, const CombinedTree& overlay) {
    DeltaTree delta;
    const std::vector<GroupName> no_parents;
    const std::vector<std::string> no_nodes;

    for (const auto& group : overlay.known_groups()) {
        const bool is_new = base.groups.count(group) == 0;
        if (is_new) {
            delta.added.insert(group);
        }

        if (const auto* weight = find_value(overlay.weights, group)) {
            const auto* base_weight = find_value(base.weights, group);
            if (base_weight == nullptr || *base_weight != *weight) {
                delta.weights[group] = *weight;
            }
        }

        const auto* parents = find_value(overlay.groups, group);
        const auto& overlay_parents = parents ? *parents : no_parents;
        const auto* base_parents = find_value(base.groups, group);
        if (is_new || base_parents == nullptr || *base_parents != overlay_parents) {
            delta.groups[group] = overlay_parents;
        }

        const auto* nodes = find_value(overlay.permissions, group);
        const auto& overlay_nodes = nodes ? *nodes : no_nodes;
        const auto* base_nodes = find_value(base.permissions, group);
        if (is_new || !same_node_set(base_nodes ? *base_nodes : no_nodes, overlay_nodes)) {
            delta.permissions[group] = overlay_nodes;
        }
    }

    return delta;
}

CombinedTree apply(const CombinedTree& base, const DeltaTree& delta) {
    CombinedTree result = base;
    for (const auto& group : delta.added) {
        result.groups[group];
        result.permissions[group];
    }
    for (const auto& [group, parents] : delta.groups) {
        result.groups[group] = parents;
        for (const auto& parent : parents) {
            result.groups[parent];
            result.permissions[parent];
        }
    }
    for (const auto& [group, weight] : delta.weights) {
        result.weights[group] = weight;
    }
    for (const auto& [group, nodes] : delta.permissions) {
        result.permissions[group] = nodes;
    }
    return result;
}

} // namespace permforge
