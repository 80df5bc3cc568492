/**
 * @file Config.hpp
 * @brief Layered tool settings
 *
 * Settings are merged in this order, later layers winning:
 *   built-in defaults -> config file (.toml or .json) ->
 *   PERMFORGE_* environment variables -> command-line overrides
 *
 * The merged tree is then read into a typed RunSettings.
 */

#ifndef PERMFORGE_CONFIG_HPP
#define PERMFORGE_CONFIG_HPP

#include "permforge/Backend.hpp"
#include "permforge/Value.hpp"

#include <toml++/toml.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace permforge {

/// Environment variable prefix for settings.
extern const char* const kEnvPrefix;

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix;   // Environment variable prefix, e.g. "PERMFORGE"
    std::map<std::string, Value> overrides;   // final precedence
    Value defaults = Value::object();
    std::vector<std::string> mandatory;
};

/**
 * @brief Settings tree with dot-notation helpers.
 */
class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    const Value& data() const noexcept { return data_; }

    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    void enforce_mandatory(const std::vector<std::string>& keys) const;

    std::string to_json_string(int indent = 2) const;

    /**
     * @brief Apply PREFIX_* environment variables.
     *
     * The rest of the name is lower-cased; "__" becomes "_" and "_" becomes
     * ".". A key that does not exist yet but matches an existing key once its
     * dots are read back as underscores is mapped onto that key, so
     * PERMFORGE_INPUT_MODULES sets `input_modules`.
     */
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    /**
     * @brief Read a .toml or .json file.
     * @throws FileNotFoundError, ParseError, PermError (unknown extension)
     */
    static Value read_file_any(const std::string& file);

private:
    Value data_ = Value::object();

    static Value toml_to_value(const toml::node& n);
    static std::string ext_of(const std::string& path);
};

// ============================================================================
// Run settings
// ============================================================================

/**
 * @brief Typed view of the merged settings
 */
struct RunSettings {
    BackendProfile plugin = BackendProfile::LuckPerms;
    std::string server;
    std::string world;
    std::string input_modules;
    std::vector<std::string> modules;
    std::string output_modules;
    std::string bperms_groups;
    bool delete_groups = false;
    bool add_groups = false;
    bool update = false;
    bool list = false;
    bool prune_inherited = false;
    bool debug = false;
    std::string default_world;
    std::optional<bool> negation;

    /// Backend grammar with the backend.* overrides applied.
    ProfileTraits traits() const;
};

/// Built-in defaults for every recognised key.
Value default_settings();

/**
 * @brief Read the merged tree into RunSettings.
 * @throws PermError naming the key if a value has the wrong type or the
 *         plugin is not supported
 */
RunSettings read_run_settings(const Config& cfg);

} // namespace permforge

#endif // PERMFORGE_CONFIG_HPP
