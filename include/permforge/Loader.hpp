/**
 * @file Loader.hpp
 * @brief YAML file loading and writing
 *
 * Implements:
 * - YAML documents to Value (using yaml-cpp)
 * - Module directories, loaded in lexicographic file-name order
 * - Context directories: the default context at the top level, one
 *   sub-directory per world
 * - Module files written back as block-style YAML
 */

#ifndef PERMFORGE_LOADER_HPP
#define PERMFORGE_LOADER_HPP

#include "permforge/Model.hpp"
#include "permforge/Value.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <vector>

namespace permforge {

// ============================================================================
// YAML documents
// ============================================================================

/**
 * @brief Convert a yaml-cpp node to a Value.
 *
 * Mappings become objects (keys as strings), sequences become arrays.
 * Quoted scalars are strings; plain scalars are typed by parse_scalar().
 */
Value yaml_to_value(const YAML::Node& node);

/**
 * @brief Parse YAML text.
 *
 * @param text YAML document
 * @param source Name used in error messages
 * @throws ParseError if the YAML syntax is invalid
 */
Value parse_yaml(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Load a YAML file.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the YAML syntax is invalid
 */
Value load_yaml_file(const std::string& path);

/**
 * @brief Load one module file.
 *
 * @throws FileNotFoundError, ParseError, SchemaError
 */
Module load_module_file(const std::string& path);

// ============================================================================
// Module directories
// ============================================================================

/**
 * @brief Load the modules of one directory.
 *
 * @param dir Directory containing *.yml module files
 * @param names Module names to load, with or without the ".yml" extension;
 *              empty loads every *.yml file in lexicographic order
 * @return Modules in load order
 * @throws LoadError if dir is not a directory or holds no *.yml files
 * @throws FileNotFoundError if a named module does not exist
 */
std::vector<Module> load_module_directory(const std::string& dir,
                                          const std::vector<std::string>& names = {});

/// Modules per context name; always contains kDefaultContext.
using ContextModules = std::map<std::string, std::vector<Module>>;

/**
 * @brief Load the default context and the requested world(s).
 *
 * @param dir Module directory; worlds are its sub-directories
 * @param world kDefaultContext, "all" (every sub-directory) or a world name
 * @param names Module names, as for load_module_directory()
 * @throws LoadError if a requested world has no sub-directory
 */
ContextModules load_context_modules(const std::string& dir, const std::string& world,
                                    const std::vector<std::string>& names = {});

/// World name that selects the default context and every world.
extern const char* const kAllWorlds;

// ============================================================================
// Writing
// ============================================================================

/**
 * @brief Render a module as block-style YAML.
 *
 * Groups (and the weights and permissions keyed by them) are listed
 * ancestors first.
 */
std::string emit_module_yaml(const Module& module);

/**
 * @brief Write modules as <name>.yml files into an existing directory.
 *
 * @throws LoadError if dir is not a directory
 * @throws PermError if a name is empty or contains a path separator, or a
 *         file cannot be written
 */
void write_module_directory(const std::map<std::string, Module>& modules, const std::string& dir);

/**
 * @brief Human-readable listing of a tree: Groups, Weights and Permissions
 *        sections, each rendered as YAML.
 */
std::string format_listing(const CombinedTree& tree);

} // namespace permforge

#endif // PERMFORGE_LOADER_HPP
