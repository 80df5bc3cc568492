/**
 * @file Convert.hpp
 * @brief Conversion between backend dumps, trees and per-stem modules
 */

#ifndef PERMFORGE_CONVERT_HPP
#define PERMFORGE_CONVERT_HPP

#include "permforge/Model.hpp"
#include "permforge/Value.hpp"

#include <map>
#include <string>
#include <vector>

namespace permforge {

/**
 * @brief Import a bPermissions groups.yml dump
 *
 * The dump has the shape
 * `{groups: {<name>: {permissions: [...], groups: [<parent>...]}}}`.
 * Nodes keep their spelling and negation marker. A dump without a
 * `groups` section yields a module with no groups.
 *
 * @param dump Parsed dump document
 * @param source Name used in diagnostics
 * @return The modules described by the dump (currently always one)
 * @throws SchemaError if the dump has the wrong shape
 */
std::vector<Module> import_bpermissions(const Value& dump, const std::string& source);

/// Module name that carries groups and weights when a tree has no permissions.
extern const char* const kGroupsModuleName;

/**
 * @brief Options for export_by_stem()
 */
struct ExportOptions {
    /**
     * Omit a node from a group when an ancestor already grants it and no
     * nearer ancestor negates it. Re-merging a pruned export no longer
     * reproduces the tree's permission lists.
     */
    bool prune_inherited = false;
};

/**
 * @brief Partition a tree into one module per permission stem
 *
 * Each module's `permissions` holds only the nodes of its stem. The
 * `groups` and `weights` maps are attached once, to the module of the
 * first stem in sorted order (or to kGroupsModuleName if the tree has no
 * permissions at all), so re-merging all modules reproduces the tree.
 * Nodes with an empty stem (".foo") are placed in kGroupsModuleName.
 *
 * @param tree Combined tree to export
 * @param options Export options
 * @param notes Optional sink for one note per pruned node
 * @return Map from stem to module
 * @throws PermError if a stem contains a path separator
 */
std::map<std::string, Module> export_by_stem(const CombinedTree& tree,
                                             const ExportOptions& options = {},
                                             std::vector<std::string>* notes = nullptr);

} // namespace permforge

#endif // PERMFORGE_CONVERT_HPP
