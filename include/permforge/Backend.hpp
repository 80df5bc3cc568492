/**
 * @file Backend.hpp
 * @brief Supported permission backends and their command grammars
 *
 * Each backend profile is a row in a fixed table: one command template per
 * operation and context kind, plus the feature flags the translator
 * consults. An empty template means the backend has no command for that
 * operation in that kind of context.
 *
 * Template placeholders: {group}, {parent}, {node}, {value}, {weight},
 * {world}.
 */

#ifndef PERMFORGE_BACKEND_HPP
#define PERMFORGE_BACKEND_HPP

#include "permforge/Model.hpp"

#include <map>
#include <string>

namespace permforge {

enum class BackendProfile {
    LuckPerms,
    BPermissions
};

enum class CommandKind {
    CreateGroup,
    DeleteGroup,
    ClearGroup,        ///< Removes all data of the built-in default group
    SetWeight,
    AddParent,
    AddPermission,
    RemovePermission
};

/**
 * @brief How a backend expresses a negated node
 */
enum class NegationStyle {
    Unsupported,   ///< Negated nodes cannot be expressed
    Marker,        ///< The node is passed verbatim, marker included ("^node")
    BooleanValue   ///< The bare node is set to {value} = false
};

struct CommandTemplate {
    std::string default_context;
    std::string world_context;
};

/**
 * @brief Command grammar and capabilities of one backend
 */
struct ProfileTraits {
    BackendProfile profile;
    std::string name;
    std::map<CommandKind, CommandTemplate> templates;
    NegationStyle negation = NegationStyle::Unsupported;
    bool supports_weights = false;
    bool delete_children_first = false;
    /// World name substituted for {world} in the default context.
    std::string default_world;
};

/**
 * @brief Built-in table row for a profile
 */
const ProfileTraits& profile_traits(BackendProfile profile);

/**
 * @brief Look up a profile by plugin name (case-insensitive)
 * @throws PermError if the plugin is not supported
 */
BackendProfile parse_profile(const std::string& name);

const char* command_kind_name(CommandKind kind);

/**
 * @brief Render one command from the profile's template table
 *
 * @param traits Backend grammar
 * @param kind Operation to render
 * @param world Context name, or kDefaultContext
 * @param args Placeholder values; "group" is required
 * @return The command text
 * @throws UnsupportedFeatureError if the profile has no template for the
 *         operation in this kind of context
 *
 * Example:
 * ```cpp
 * render_command(profile_traits(BackendProfile::LuckPerms),
 *                CommandKind::AddParent, "nether",
 *                {{"group", "Admins"}, {"parent", "Moderators"}});
 * // "lp group Admins parent add Moderators world=nether"
 * ```
 */
std::string render_command(const ProfileTraits& traits, CommandKind kind,
                           const std::string& world,
                           const std::map<std::string, std::string>& args);

} // namespace permforge

#endif // PERMFORGE_BACKEND_HPP
