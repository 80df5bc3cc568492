/**
 * @file Graph.hpp
 * @brief Cycle detection and topological ordering of the parent graph
 *
 * One traversal serves both directions: creation order (every group after
 * all of its ancestors) and deletion order (every group before any of its
 * ancestors).
 */

#ifndef PERMFORGE_GRAPH_HPP
#define PERMFORGE_GRAPH_HPP

#include "permforge/Model.hpp"
#include <vector>

namespace permforge {

/**
 * @brief Which end of an inheritance edge comes first
 */
enum class EdgeDirection {
    ParentsFirst,  ///< Ancestors before descendants (creation order)
    ChildrenFirst  ///< Deepest descendants before ancestors (deletion order)
};

/**
 * @brief Order all groups of a parent graph topologically
 *
 * Every group that appears as a key or as a parent is included. Groups that
 * are not related by inheritance are ordered case-insensitively, so the
 * result is deterministic.
 *
 * @param parents Map from group to its parent list
 * @param direction Which end of each edge is emitted first
 * @return All groups in the requested order
 * @throws CyclicInheritanceError if the graph contains a cycle
 */
std::vector<GroupName> topological_order(const ParentMap& parents, EdgeDirection direction);

/**
 * @brief All ancestors of a group, nearest first
 *
 * Breadth-first over the parent lists, so ancestors at the same distance
 * keep declaration order. Each ancestor is listed once even if it is
 * reachable along several paths, and the group itself is never listed.
 */
std::vector<GroupName> ancestors_of(const GroupName& group, const ParentMap& parents);

} // namespace permforge

#endif // PERMFORGE_GRAPH_HPP
