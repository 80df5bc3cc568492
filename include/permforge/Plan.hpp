/**
 * @file Plan.hpp
 * @brief Command planning across the default context and its worlds
 *
 * The default context is translated as a full tree. A world is deleted as
 * a full tree (its data for every group it declares) and added as the delta
 * against the default context, so only settings that differ from the
 * default context are written to the world.
 *
 * With the world "all", every delete command for every context precedes
 * every add command; within each phase the default context comes first and
 * the worlds follow in sorted order.
 */

#ifndef PERMFORGE_PLAN_HPP
#define PERMFORGE_PLAN_HPP

#include "permforge/Loader.hpp"
#include "permforge/Translate.hpp"

#include <map>
#include <string>
#include <vector>

namespace permforge {

/**
 * @brief A command together with the context it applies to
 */
struct PlannedCommand {
    std::string world;
    Command command;
};

/// Combined tree per context name.
using ContextTrees = std::map<std::string, CombinedTree>;

/**
 * @brief Merge the modules of every context
 *
 * @throws CaseConflictError if a group is spelled differently within a
 *         context or between two contexts
 */
ContextTrees merge_contexts(const ContextModules& contexts,
                            std::vector<std::string>* warnings = nullptr);

/**
 * @brief Contexts that a world selection covers, in processing order
 *
 * @param trees Loaded contexts
 * @param world kDefaultContext, kAllWorlds or a world name
 * @throws LoadError if a named world was not loaded
 */
std::vector<std::string> selected_contexts(const ContextTrees& trees, const std::string& world);

/**
 * @brief Plan every command for a world selection
 *
 * Either the whole plan is returned or an exception is thrown. Group
 * spelling is checked across every loaded context, and every selected
 * context's parent graph is checked for cycles, before any command is
 * planned.
 *
 * @param trees Combined tree per context; must contain kDefaultContext
 * @param world kDefaultContext, kAllWorlds or a world name
 * @param intent Phases to run
 * @param traits Backend grammar and capabilities
 * @param warnings Optional sink for skipped settings
 * @throws CaseConflictError, CyclicInheritanceError, UnsupportedFeatureError,
 *         LoadError
 */
std::vector<PlannedCommand> plan_commands(const ContextTrees& trees, const std::string& world,
                                          const Intent& intent, const ProfileTraits& traits,
                                          std::vector<std::string>* warnings = nullptr);

} // namespace permforge

#endif // PERMFORGE_PLAN_HPP
