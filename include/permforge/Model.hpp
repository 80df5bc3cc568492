/**
 * @file Model.hpp
 * @brief Document model: modules, combined trees and delta trees
 *
 * A Module is one parsed input document. A CombinedTree is the result of
 * merging the modules of one context (the default context or a named
 * world). A DeltaTree is the part of a world's CombinedTree that differs
 * from the default context.
 */

#ifndef PERMFORGE_MODEL_HPP
#define PERMFORGE_MODEL_HPP

#include "permforge/Value.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace permforge {

/// Name of the default (global) context.
extern const char* const kDefaultContext;

/// True if `world` names the default context.
bool is_default_context(const std::string& world);

// ============================================================================
// Group names and permission nodes
// ============================================================================

/**
 * @brief Case-preserving group identifier
 *
 * Ordering uses the lower-cased canonical form, so maps keyed by GroupName
 * iterate case-insensitively; the original spelling breaks ties. Equality
 * compares the original spelling. Within one tree no two names may share a
 * canonical form (the merge engine rejects that with CaseConflictError).
 */
class GroupName {
public:
    GroupName() = default;
    GroupName(std::string name);
    GroupName(const char* name) : GroupName(std::string(name)) {}

    const std::string& str() const noexcept { return original_; }
    const std::string& canonical() const noexcept { return canonical_; }

    // The backend's built-in group, which always exists and is never created.
    bool is_builtin_default() const noexcept { return canonical_ == "default"; }

    bool operator<(const GroupName& other) const {
        if (canonical_ != other.canonical_) return canonical_ < other.canonical_;
        return original_ < other.original_;
    }
    bool operator==(const GroupName& other) const { return original_ == other.original_; }
    bool operator!=(const GroupName& other) const { return !(*this == other); }

private:
    std::string original_;
    std::string canonical_;
};

/// Marker prefix of a negated permission node.
constexpr char kNegationMarker = '^';

/// Separator between namespace segments of a permission node.
constexpr char kNamespaceSeparator = '.';

/// True if the node carries the negation marker.
bool is_negated(const std::string& node);

/// The node text without its negation marker.
std::string strip_negation(const std::string& node);

/**
 * @brief Namespace stem of a permission node
 *
 * The text before the first '.', ignoring a leading negation marker and
 * lower-cased, e.g. "^WorldEdit.wand" -> "worldedit". A node without a
 * separator is its own stem.
 */
std::string node_stem(const std::string& node);

/// Case-insensitive strict weak ordering of permission nodes.
bool node_less(const std::string& a, const std::string& b);

/// Case-insensitive equality of permission nodes (marker included).
bool node_equal(const std::string& a, const std::string& b);

/// Sort case-insensitively and drop case-insensitive duplicates, keeping the first spelling.
std::vector<std::string> normalize_nodes(std::vector<std::string> nodes);

/// Compare two node lists as case-insensitive sets.
bool same_node_set(const std::vector<std::string>& a, const std::vector<std::string>& b);

// ============================================================================
// Module
// ============================================================================

/**
 * @brief One parsed module document
 *
 * Any of the three sections may be absent in the source document, in which
 * case the corresponding map is empty and the has_* flag is false.
 */
struct Module {
    /// Where the document came from (file path, or a label for in-memory documents).
    std::string source;

    std::map<std::string, std::vector<std::string>> groups;
    std::map<std::string, std::int64_t> weights;
    std::map<std::string, std::vector<std::string>> permissions;

    bool has_groups = false;
    bool has_weights = false;
    bool has_permissions = false;

    /// Top-level keys other than groups, weights and permissions.
    std::vector<std::string> unknown_keys;

    /**
     * @brief Build a Module from a parsed document
     *
     * A null document (empty file) yields an empty Module.
     *
     * @param doc Parsed document
     * @param source Name used in diagnostics
     * @throws SchemaError if the document or a section has the wrong shape
     */
    static Module from_value(const Value& doc, const std::string& source);

    /// Inverse of from_value: only present sections are emitted.
    Value to_value() const;

    bool operator==(const Module& other) const;
};

// ============================================================================
// Trees
// ============================================================================

/// Map from group to its ordered parent list.
using ParentMap = std::map<GroupName, std::vector<GroupName>>;

/**
 * @brief Fields shared by CombinedTree and DeltaTree
 */
struct GroupTree {
    ParentMap groups;
    std::map<GroupName, std::int64_t> weights;
    std::map<GroupName, std::vector<std::string>> permissions;

    /// Every group mentioned as a key or as a parent, in key order.
    std::set<GroupName> known_groups() const;

    bool operator==(const GroupTree& other) const {
        return groups == other.groups && weights == other.weights &&
               permissions == other.permissions;
    }
    bool operator!=(const GroupTree& other) const { return !(*this == other); }
};

/**
 * @brief Merged groups, weights and permissions of one context
 *
 * Every known group has an entry in both `groups` and `permissions`
 * (possibly empty). Permission lists are sorted case-insensitively and
 * free of case-insensitive duplicates.
 */
struct CombinedTree : GroupTree {
};

/**
 * @brief Minimal override of a world's CombinedTree relative to the default
 *
 * A field is present only where it differs from the default context.
 * Permission lists, when present, are complete lists for the world.
 */
struct DeltaTree : GroupTree {
    /// Groups of the world that do not exist in the default context.
    std::set<GroupName> added;

    bool empty() const {
        return groups.empty() && weights.empty() && permissions.empty() && added.empty();
    }

    bool operator==(const DeltaTree& other) const {
        return GroupTree::operator==(other) && added == other.added;
    }
};

/**
 * @brief Render a CombinedTree as a single Module
 *
 * Re-merging the result reproduces the tree.
 */
Module tree_to_module(const CombinedTree& tree, const std::string& source);

} // namespace permforge

#endif // PERMFORGE_MODEL_HPP
