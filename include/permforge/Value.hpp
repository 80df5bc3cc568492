/**
 * @file Value.hpp
 * @brief Value type for parsed documents
 *
 * Uses nlohmann::json as the in-memory form of every parsed document,
 * whether it came from YAML (module files, backend dumps), TOML or JSON
 * (tool configuration):
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef PERMFORGE_VALUE_HPP
#define PERMFORGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace permforge {

/**
 * @brief JSON-like value type for parsed documents
 *
 * This is an alias for nlohmann::json. Module documents are handed to the
 * document model in this form, independent of the syntax they were
 * written in.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "list", "mapping")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "list";
    if (val.is_object()) return "mapping";
    return "unknown";
}

} // namespace permforge

#endif // PERMFORGE_VALUE_HPP
