/**
 * @file Translate.hpp
 * @brief Translation of trees into ordered backend commands
 *
 * Phases, in order: delete, create groups, set weights, set parents, set
 * permissions. The delete phase runs only for a delete intent; the others
 * only for an add intent.
 *
 * Translation is all-or-nothing: the parent graph is checked for cycles and
 * every command is rendered before anything is returned, so an error never
 * leaves a partial sequence behind.
 */

#ifndef PERMFORGE_TRANSLATE_HPP
#define PERMFORGE_TRANSLATE_HPP

#include "permforge/Backend.hpp"
#include "permforge/Model.hpp"

#include <string>
#include <vector>

namespace permforge {

/**
 * @brief Which phases to run
 */
struct Intent {
    bool remove = false;
    bool add = false;
};

/**
 * @brief One backend command and the group it concerns
 */
struct Command {
    CommandKind kind;
    std::string group;
    std::string text;
};

/**
 * @brief Translate a full context tree
 *
 * Every known group is created (except the built-in `default` group) and,
 * for a delete intent, deleted. In the delete phase `default` is cleared
 * instead of deleted.
 *
 * @param tree Combined tree of the context
 * @param intent Phases to run
 * @param world Context name, or kDefaultContext
 * @param traits Backend grammar and capabilities
 * @param warnings Optional sink for skipped settings (weights on a backend
 *                 without weights)
 * @throws CyclicInheritanceError if the parent graph has a cycle
 * @throws UnsupportedFeatureError if the backend cannot express a command
 */
std::vector<Command> translate(const CombinedTree& tree, const Intent& intent,
                               const std::string& world, const ProfileTraits& traits,
                               std::vector<std::string>* warnings = nullptr);

/**
 * @brief Translate a world delta
 *
 * Only groups new to the world are created; only fields present in the
 * delta produce commands.
 */
std::vector<Command> translate(const DeltaTree& delta, const Intent& intent,
                               const std::string& world, const ProfileTraits& traits,
                               std::vector<std::string>* warnings = nullptr);

} // namespace permforge

#endif // PERMFORGE_TRANSLATE_HPP
