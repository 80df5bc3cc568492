/**
 * @file Parse.hpp
 * @brief Typing of plain YAML scalars
 *
 * yaml-cpp hands every scalar over as text. Plain (unquoted) scalars are
 * typed with these rules, first match wins:
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", "~" or empty)
 * - Integer (matches ^[-+]?[0-9]+$)
 * - Float (matches ^[-+]?[0-9]*\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - String (everything else)
 *
 * Quoted scalars never reach this function; they are always strings.
 */

#ifndef PERMFORGE_PARSE_HPP
#define PERMFORGE_PARSE_HPP

#include "permforge/Value.hpp"
#include <string>

namespace permforge {

/**
 * @brief Parse a plain scalar to the appropriate Value type
 *
 * Examples:
 * ```cpp
 * parse_scalar("true")          // → true (boolean)
 * parse_scalar("~")             // → null
 * parse_scalar("42")            // → 42 (integer)
 * parse_scalar("-2.5e10")       // → -2.5e10 (float)
 * parse_scalar("bukkit.*")      // → "bukkit.*" (string)
 * parse_scalar("^worldedit.*")  // → "^worldedit.*" (string)
 * ```
 */
Value parse_scalar(const std::string& str);

} // namespace permforge

#endif // PERMFORGE_PARSE_HPP
