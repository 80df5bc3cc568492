/**
 * @file Config.cpp
 * @brief Layered settings implementation
 */

#include "permforge/Config.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Model.hpp"
#include "permforge/Util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace permforge {

const char* const kEnvPrefix = "PERMFORGE";

Config Config::load(const LoadOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, read_file_any(*opts.file_path));
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    // 5) mandatory
    cfg.enforce_mandatory(opts.mandatory);

    return cfg;
}

const Value& Config::at(const std::string& path) const {
    return get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return exists_by_dot(data_, path);
}

void Config::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

void Config::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

std::string Config::to_json_string(int indent) const {
    return data_.dump(indent);
}

// ============================================================================
// Environment and overrides
// ============================================================================

namespace {

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string env_name_to_key(const std::string& name) {
    const std::string marker = "\x1F";
    std::string key = to_lower(name);
    key = replace_all(key, "__", marker);
    key = replace_all(key, "_", ".");
    return replace_all(key, marker, "_");
}

void collect_keys(const Value& data, const std::string& prefix, std::set<std::string>& keys) {
    if (!data.is_object()) return;
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        keys.insert(key);
        collect_keys(it.value(), key, keys);
    }
}

/**
 * @brief Map a dotted key onto an existing key that contains underscores.
 *
 * Tries every split of the underscore-joined name into a parent part and a
 * leaf part, e.g. "backend.default.world" -> "backend.default_world".
 */
std::string remap_key(const std::string& key, const std::set<std::string>& known) {
    if (known.count(key)) return key;
    const std::string flat = replace_all(key, ".", "_");
    if (known.count(flat)) return flat;
    for (size_t pos = flat.find('_'); pos != std::string::npos; pos = flat.find('_', pos + 1)) {
        const std::string candidate = replace_all(flat.substr(0, pos), "_", ".") + "." +
                                      flat.substr(pos + 1);
        if (known.count(candidate)) return candidate;
    }
    return key;
}

} // anonymous namespace

void Config::apply_env_prefix(const std::string& prefix) {
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    std::set<std::string> known;
    collect_keys(data_, "", known);

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.size() <= normalized.size() || name.rfind(normalized, 0) != 0) continue;
        const std::string key = remap_key(env_name_to_key(name.substr(normalized.size())), known);
        if (key.empty()) continue;
        set_by_dot(data_, key, parse_json_or_string(value));
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

// ============================================================================
// File IO
// ============================================================================

Value Config::toml_to_value(const toml::node& n) {
    if (auto v = n.as_string()) {
        return Value(v->get());
    } else if (auto v = n.as_integer()) {
        return Value(v->get());
    } else if (auto v = n.as_floating_point()) {
        return Value(v->get());
    } else if (auto v = n.as_boolean()) {
        return Value(v->get());
    } else if (auto v = n.as_array()) {
        Value arr = Value::array();
        for (const auto& elem : *v) arr.push_back(toml_to_value(elem));
        return arr;
    } else if (auto v = n.as_table()) {
        Value obj = Value::object();
        for (const auto& [k, val] : *v) {
            obj[std::string(k.str())] = toml_to_value(val);
        }
        return obj;
    } else if (auto v = n.as_date()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = n.as_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = n.as_date_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    }
    return Value();
}

std::string Config::ext_of(const std::string& path) {
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos) return "";
    return to_lower(path.substr(pos));
}

Value Config::read_file_any(const std::string& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        throw FileNotFoundError(file);
    }

    const std::string ext = ext_of(file);
    if (ext == ".json") {
        std::ifstream ifs(file);
        if (!ifs) throw FileNotFoundError(file);
        try {
            return Value::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError(file, 0, 0, e.what());
        }
    } else if (ext == ".toml") {
        try {
            toml::table tbl = toml::parse_file(file);
            return toml_to_value(tbl);
        } catch (const toml::parse_error& e) {
            const auto& begin = e.source().begin;
            throw ParseError(file, static_cast<int>(begin.line), static_cast<int>(begin.column),
                             std::string(e.description()));
        }
    }
    throw PermError("unsupported config file type '" + ext + "': " + file);
}

// ============================================================================
// Run settings
// ============================================================================

namespace {

std::string get_string(const Config& cfg, const char* key) {
    const Value& v = cfg.at(key);
    if (v.is_null()) return "";
    // Environment values such as PERMFORGE_SERVER=1 arrive as numbers.
    if (v.is_number()) return v.dump();
    if (!v.is_string()) {
        throw PermError(std::string("setting '") + key + "' must be a string, got " + type_name(v));
    }
    return v.get<std::string>();
}

bool get_bool(const Config& cfg, const char* key) {
    const Value& v = cfg.at(key);
    if (!v.is_boolean()) {
        throw PermError(std::string("setting '") + key + "' must be a boolean, got " + type_name(v));
    }
    return v.get<bool>();
}

// A list, or a comma-separated string as set from the environment.
std::vector<std::string> get_string_list(const Config& cfg, const char* key) {
    const Value& v = cfg.at(key);
    std::vector<std::string> out;
    if (v.is_null()) return out;
    if (v.is_string()) {
        for (const auto& part : split(v.get<std::string>(), ',')) {
            if (!part.empty()) out.push_back(part);
        }
        return out;
    }
    if (!v.is_array()) {
        throw PermError(std::string("setting '") + key + "' must be a list, got " + type_name(v));
    }
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw PermError(std::string("setting '") + key + "' must list strings, got " +
                            type_name(item));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // anonymous namespace

Value default_settings() {
    return Value{
        {"plugin", "LuckPerms"},
        {"server", ""},
        {"world", kDefaultContext},
        {"input_modules", ""},
        {"modules", Value::array()},
        {"output_modules", ""},
        {"bperms_groups", ""},
        {"delete", false},
        {"add", false},
        {"update", false},
        {"list", false},
        {"prune_inherited", false},
        {"debug", false},
        {"backend", {
            {"default_world", "world"},
            {"negation", nullptr}
        }}
    };
}

RunSettings read_run_settings(const Config& cfg) {
    RunSettings s;
    s.plugin = parse_profile(get_string(cfg, "plugin"));
    s.server = get_string(cfg, "server");
    s.world = get_string(cfg, "world");
    if (s.world.empty()) s.world = kDefaultContext;
    s.input_modules = get_string(cfg, "input_modules");
    s.modules = get_string_list(cfg, "modules");
    s.output_modules = get_string(cfg, "output_modules");
    s.bperms_groups = get_string(cfg, "bperms_groups");
    s.delete_groups = get_bool(cfg, "delete");
    s.add_groups = get_bool(cfg, "add");
    s.update = get_bool(cfg, "update");
    s.list = get_bool(cfg, "list");
    s.prune_inherited = get_bool(cfg, "prune_inherited");
    s.debug = get_bool(cfg, "debug");
    s.default_world = get_string(cfg, "backend.default_world");

    const Value& negation = cfg.at("backend.negation");
    if (!negation.is_null()) {
        if (!negation.is_boolean()) {
            throw PermError("setting 'backend.negation' must be a boolean, got " +
                            type_name(negation));
        }
        s.negation = negation.get<bool>();
    }
    return s;
}

ProfileTraits RunSettings::traits() const {
    ProfileTraits traits = profile_traits(plugin);
    if (plugin == BackendProfile::BPermissions && !default_world.empty()) {
        traits.default_world = default_world;
    }
    if (negation.has_value() && !*negation) {
        traits.negation = NegationStyle::Unsupported;
    }
    return traits;
}

} // namespace permforge
