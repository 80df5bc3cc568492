/**
 * @file Merge.hpp
 * @brief Folding module documents into one combined tree per context
 *
 * Merging rules:
 * - Parent lists: concatenated in load order, duplicates dropped keeping the
 *   first occurrence
 * - Weights: the last module that sets a group's weight wins
 * - Permissions: unioned, then sorted case-insensitively with
 *   case-insensitive duplicates collapsed to the first spelling seen
 */

#ifndef PERMFORGE_MERGE_HPP
#define PERMFORGE_MERGE_HPP

#include "permforge/Model.hpp"
#include <string>
#include <vector>

namespace permforge {

/**
 * @brief Merge modules in load order into a CombinedTree
 *
 * @param modules Modules in load order (lowest precedence first)
 * @param warnings Optional sink for non-fatal diagnostics (unknown
 *                 top-level keys); nothing is reported when null
 * @return The combined tree; every known group has an entry in both
 *         `groups` and `permissions`
 * @throws CaseConflictError if a group name appears in two letter cases
 *
 * Example:
 * ```cpp
 * // A: {permissions: {default: [aplugin.player], Moderators: [aplugin.staff]}}
 * // B: {permissions: {default: [bplugin.player], Admins: [bplugin.*]}}
 * auto tree = merge({a, b});
 * // tree.permissions["default"] == {"aplugin.player", "bplugin.player"}
 * ```
 */
CombinedTree merge(const std::vector<Module>& modules,
                   std::vector<std::string>* warnings = nullptr);

/**
 * @brief Merge one more module into an existing tree
 *
 * merge() is a fold of this function over its input, so
 * merge_into(merge({a, b}), c) equals merge({a, b, c}).
 *
 * @throws CaseConflictError if the module spells a known group differently
 */
void merge_into(CombinedTree& tree, const Module& module,
                std::vector<std::string>* warnings = nullptr);

/**
 * @brief Check that a group is spelled the same way in every tree
 *
 * Each tree is consistent on its own after merge(); this extends the check
 * across the contexts of one run.
 *
 * @throws CaseConflictError naming the first spelling seen and the other one
 */
void check_group_spelling(const std::vector<const GroupTree*>& trees);

} // namespace permforge

#endif // PERMFORGE_MERGE_HPP
