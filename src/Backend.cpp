/**
 * @file Backend.cpp
 * @brief Command template tables
 */

#include "permforge/Backend.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Util.hpp"

namespace permforge {

namespace {

ProfileTraits make_luckperms() {
    ProfileTraits t;
    t.profile = BackendProfile::LuckPerms;
    t.name = "LuckPerms";
    // Groups are global in LuckPerms; only their data can be scoped to a world.
    t.templates = {
        {CommandKind::CreateGroup,
         {"lp creategroup {group}", ""}},
        {CommandKind::DeleteGroup,
         {"lp deletegroup {group}", "lp group {group} clear world={world}"}},
        {CommandKind::ClearGroup,
         {"lp group {group} clear", "lp group {group} clear world={world}"}},
        {CommandKind::SetWeight,
         {"lp group {group} setweight {weight}",
          "lp group {group} setweight {weight} world={world}"}},
        {CommandKind::AddParent,
         {"lp group {group} parent add {parent}",
          "lp group {group} parent add {parent} world={world}"}},
        {CommandKind::AddPermission,
         {"lp group {group} permission set {node} {value}",
          "lp group {group} permission set {node} {value} world={world}"}},
        {CommandKind::RemovePermission,
         {"lp group {group} permission unset {node}",
          "lp group {group} permission unset {node} world={world}"}},
    };
    t.negation = NegationStyle::BooleanValue;
    t.supports_weights = true;
    t.delete_children_first = true;
    return t;
}

ProfileTraits make_bpermissions() {
    ProfileTraits t;
    t.profile = BackendProfile::BPermissions;
    t.name = "bPermissions";
    t.templates = {
        {CommandKind::CreateGroup,
         {"group {group}", "group {group} w:{world}"}},
        {CommandKind::DeleteGroup, {"", ""}},
        {CommandKind::ClearGroup, {"", ""}},
        {CommandKind::SetWeight, {"", ""}},
        {CommandKind::AddParent,
         {"exec g:{group} a:addgroup v:{parent} w:{world}",
          "exec g:{group} a:addgroup v:{parent} w:{world}"}},
        {CommandKind::AddPermission,
         {"exec g:{group} a:addperm v:{node} w:{world}",
          "exec g:{group} a:addperm v:{node} w:{world}"}},
        {CommandKind::RemovePermission,
         {"exec g:{group} a:rmperm v:{node} w:{world}",
          "exec g:{group} a:rmperm v:{node} w:{world}"}},
    };
    t.negation = NegationStyle::Marker;
    t.supports_weights = false;
    t.delete_children_first = false;
    t.default_world = "world";
    return t;
}

std::string lookup(const std::map<std::string, std::string>& args, const char* key) {
    auto it = args.find(key);
    return it == args.end() ? std::string() : it->second;
}

} // anonymous namespace

const ProfileTraits& profile_traits(BackendProfile profile) {
    static const ProfileTraits luckperms = make_luckperms();
    static const ProfileTraits bpermissions = make_bpermissions();
    return profile == BackendProfile::LuckPerms ? luckperms : bpermissions;
}

BackendProfile parse_profile(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "luckperms") return BackendProfile::LuckPerms;
    if (lower == "bpermissions") return BackendProfile::BPermissions;
    throw PermError("unsupported permissions plugin: " + name);
}

const char* command_kind_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::CreateGroup: return "group creation";
        case CommandKind::DeleteGroup: return "group deletion";
        case CommandKind::ClearGroup: return "clearing the default group";
        case CommandKind::SetWeight: return "group weights";
        case CommandKind::AddParent: return "parent groups";
        case CommandKind::AddPermission: return "adding permissions";
        case CommandKind::RemovePermission: return "removing permissions";
    }
    return "unknown operation";
}

std::string render_command(const ProfileTraits& traits, CommandKind kind,
                           const std::string& world,
                           const std::map<std::string, std::string>& args) {
    const bool default_ctx = is_default_context(world);
    auto it = traits.templates.find(kind);
    const std::string pattern = it == traits.templates.end()
        ? std::string()
        : (default_ctx ? it->second.default_context : it->second.world_context);

    if (pattern.empty()) {
        std::string feature = command_kind_name(kind);
        if (!default_ctx) feature += " in world '" + world + "'";
        throw UnsupportedFeatureError(traits.name, feature, lookup(args, "group"),
                                      lookup(args, "node"));
    }

    std::map<std::string, std::string> vars = args;
    vars["world"] = default_ctx ? traits.default_world : world;
    return substitute(pattern, vars);
}

} // namespace permforge
