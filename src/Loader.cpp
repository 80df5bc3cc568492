/**
 * @file Loader.cpp
 * @brief YAML loading and writing implementation
 *
 * Module files are read with yaml-cpp and converted to Value so that the
 * document model never sees YAML types directly.
 */

#include "permforge/Loader.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Graph.hpp"
#include "permforge/Parse.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace permforge {

const char* const kAllWorlds = "all";

// ============================================================================
// Utility functions
// ============================================================================

namespace {

const char* const kModuleExtension = ".yml";

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

bool dir_exists(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool is_quoted_string(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    return tag == "!" || tag == "tag:yaml.org,2002:str";
}

Value convert_node(const YAML::Node& node, const std::string& source) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value(nullptr);

        case YAML::NodeType::Scalar:
            if (is_quoted_string(node)) {
                return Value(node.Scalar());
            }
            return parse_scalar(node.Scalar());

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& elem : node) {
                arr.push_back(convert_node(elem, source));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                if (!kv.first.IsScalar()) {
                    const auto& mark = kv.first.Mark();
                    throw ParseError(source, mark.line + 1, mark.column + 1,
                                     "mapping keys must be scalars");
                }
                obj[kv.first.Scalar()] = convert_node(kv.second, source);
            }
            return obj;
        }
    }
    return Value(nullptr);
}

/**
 * @brief Emit a string, quoting it when a plain scalar would read back as
 *        something other than a string.
 */
void emit_string(YAML::Emitter& out, const std::string& s) {
    if (!parse_scalar(s).is_string()) {
        out << YAML::DoubleQuoted << s;
    } else {
        out << s;
    }
}

void emit_string_list(YAML::Emitter& out, const std::vector<std::string>& items) {
    if (items.empty()) {
        out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
        return;
    }
    out << YAML::BeginSeq;
    for (const auto& item : items) emit_string(out, item);
    out << YAML::EndSeq;
}

/**
 * @brief Every group key of the module, ancestors first.
 */
std::vector<std::string> natural_group_order(const Module& module) {
    ParentMap graph;
    for (const auto& [group, parents] : module.groups) {
        auto& out = graph[GroupName(group)];
        for (const auto& parent : parents) out.emplace_back(parent);
    }
    for (const auto& entry : module.weights) graph[GroupName(entry.first)];
    for (const auto& entry : module.permissions) graph[GroupName(entry.first)];

    std::set<std::string> keys;
    for (const auto& entry : module.groups) keys.insert(entry.first);
    for (const auto& entry : module.weights) keys.insert(entry.first);
    for (const auto& entry : module.permissions) keys.insert(entry.first);

    std::vector<GroupName> sorted;
    try {
        sorted = topological_order(graph, EdgeDirection::ParentsFirst);
    } catch (const CyclicInheritanceError&) {
        // A cyclic module is still written out, in plain key order.
        for (const auto& entry : graph) sorted.push_back(entry.first);
    }

    std::vector<std::string> order;
    for (const auto& group : sorted) {
        if (keys.count(group.str())) order.push_back(group.str());
    }
    return order;
}

template <typename Map, typename EmitValue>
void emit_section(YAML::Emitter& out, const char* name, const Map& map,
                  const std::vector<std::string>& order, EmitValue emit_value) {
    out << YAML::Key << name << YAML::Value;
    if (map.empty()) {
        out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
        return;
    }
    out << YAML::BeginMap;
    for (const auto& key : order) {
        auto it = map.find(key);
        if (it == map.end()) continue;
        out << YAML::Key;
        emit_string(out, key);
        out << YAML::Value;
        emit_value(it->second);
    }
    out << YAML::EndMap;
}

std::string finish(const YAML::Emitter& out) {
    if (!out.good()) {
        throw PermError("YAML emitter error: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

} // anonymous namespace

// ============================================================================
// YAML documents
// ============================================================================

Value yaml_to_value(const YAML::Node& node) {
    return convert_node(node, "<yaml>");
}

Value parse_yaml(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw ParseError(source, e.mark.line + 1, e.mark.column + 1, e.msg);
    }
    return convert_node(root, source);
}

Value load_yaml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_yaml(read_file(path), path);
}

Module load_module_file(const std::string& path) {
    return Module::from_value(load_yaml_file(path), path);
}

// ============================================================================
// Module directories
// ============================================================================

std::vector<Module> load_module_directory(const std::string& dir,
                                          const std::vector<std::string>& names) {
    if (!dir_exists(dir)) {
        throw LoadError("the specified module directory does not exist: " + dir);
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == kModuleExtension) {
            files.push_back(entry.path().filename().string());
        }
    }
    if (files.empty()) {
        throw LoadError("no " + std::string(kModuleExtension) + " files in " + dir);
    }
    std::sort(files.begin(), files.end());

    if (!names.empty()) {
        files.clear();
        for (const auto& name : names) {
            const bool has_ext = name.size() >= 4 &&
                                 name.compare(name.size() - 4, 4, kModuleExtension) == 0;
            files.push_back(has_ext ? name : name + kModuleExtension);
        }
    }

    std::vector<Module> modules;
    modules.reserve(files.size());
    for (const auto& file : files) {
        modules.push_back(load_module_file((fs::path(dir) / file).string()));
    }
    return modules;
}

ContextModules load_context_modules(const std::string& dir, const std::string& world,
                                    const std::vector<std::string>& names) {
    ContextModules contexts;
    contexts[kDefaultContext] = load_module_directory(dir, names);

    if (world == kAllWorlds) {
        std::vector<fs::path> worlds;
        for (const auto& entry : fs::directory_iterator(dir)) {
            const std::string name = entry.path().filename().string();
            if (entry.is_directory() && !name.empty() && name.front() != '.') {
                worlds.push_back(entry.path());
            }
        }
        std::sort(worlds.begin(), worlds.end());
        for (const auto& path : worlds) {
            contexts[path.filename().string()] = load_module_directory(path.string(), names);
        }
    } else if (!is_default_context(world)) {
        const fs::path world_dir = fs::path(dir) / world;
        if (!dir_exists(world_dir.string())) {
            throw LoadError("context \"" + world + "\" is not a sub-directory of module directory \"" +
                            dir + "\"");
        }
        contexts[world] = load_module_directory(world_dir.string(), names);
    }
    return contexts;
}

// ============================================================================
// Writing
// ============================================================================

std::string emit_module_yaml(const Module& module) {
    const auto order = natural_group_order(module);

    YAML::Emitter out;
    out << YAML::BeginMap;
    if (module.has_groups) {
        emit_section(out, "groups", module.groups, order,
                     [&](const std::vector<std::string>& parents) { emit_string_list(out, parents); });
    }
    if (module.has_weights) {
        emit_section(out, "weights", module.weights, order,
                     [&](std::int64_t weight) { out << weight; });
    }
    if (module.has_permissions) {
        emit_section(out, "permissions", module.permissions, order,
                     [&](const std::vector<std::string>& nodes) { emit_string_list(out, nodes); });
    }
    out << YAML::EndMap;
    return finish(out);
}

void write_module_directory(const std::map<std::string, Module>& modules, const std::string& dir) {
    if (!dir_exists(dir)) {
        throw LoadError("the output directory does not exist: " + dir);
    }
    for (const auto& [name, module] : modules) {
        if (name.empty() || name.find_first_of("/\\") != std::string::npos) {
            throw PermError("invalid module name \"" + name + "\"");
        }
        const fs::path path = fs::path(dir) / (name + kModuleExtension);
        std::ofstream ofs(path);
        if (!ofs) {
            throw PermError("cannot open module file \"" + path.string() + "\" to write");
        }
        ofs << emit_module_yaml(module);
        if (!ofs) {
            throw PermError("failed to write module file \"" + path.string() + "\"");
        }
    }
}

std::string format_listing(const CombinedTree& tree) {
    Module module = tree_to_module(tree, "listing");
    std::ostringstream oss;

    auto section = [&](const char* title, bool present, const Module& part) {
        if (!present) return;
        std::string text = emit_module_yaml(part);
        // Drop the outer "<section>:" line and its indentation.
        auto newline = text.find('\n');
        std::string body = newline == std::string::npos ? text : text.substr(newline + 1);
        std::string dedented;
        std::istringstream lines(body);
        std::string line;
        while (std::getline(lines, line)) {
            dedented += (line.compare(0, 2, "  ") == 0 ? line.substr(2) : line) + "\n";
        }
        oss << title << "\n" << std::string(std::char_traits<char>::length(title), '~') << "\n"
            << dedented << "\n";
    };

    Module groups_only = module;
    groups_only.has_weights = groups_only.has_permissions = false;
    Module weights_only = module;
    weights_only.has_groups = weights_only.has_permissions = false;
    Module permissions_only = module;
    permissions_only.has_groups = permissions_only.has_weights = false;

    section("Groups", !tree.groups.empty(), groups_only);
    section("Weights", !tree.weights.empty(), weights_only);
    section("Permissions", !tree.permissions.empty(), permissions_only);
    return oss.str();
}

} // namespace permforge
