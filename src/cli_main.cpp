#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "permforge/Config.hpp"
#include "permforge/Convert.hpp"
#include "permforge/Dispatch.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Loader.hpp"
#include "permforge/Plan.hpp"

using namespace permforge;

namespace {

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) std::cerr << "WARNING: " << w << "\n";
}

// Modules for the bPermissions import: the imported tree is the selected context.
ContextModules import_contexts(const RunSettings& s) {
    if (s.world == kAllWorlds) {
        throw PermError("a bPermissions import describes a single context; it cannot be used "
                        "with world \"all\"");
    }
    ContextModules contexts;
    contexts[kDefaultContext];
    contexts[s.world] = import_bpermissions(load_yaml_file(s.bperms_groups), s.bperms_groups);
    return contexts;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("permforge",
            "Configure permission groups of a server through mark2 send commands.\n"
            "Also converts bPermissions groups.yml files to module files.");

        options.add_options()
            ("s,server", "Name of the server in the mark2 tabs", cxxopts::value<std::string>())
            ("i,input-modules", "Directory of YAML permission modules (defaults to the server name)",
             cxxopts::value<std::string>())
            ("w,world", "World to configure: a sub-directory of the modules directory, "
                        "\"default\" or \"all\"", cxxopts::value<std::string>())
            ("m,modules", "Module file names to load (repeatable, \".yml\" optional)",
             cxxopts::value<std::vector<std::string>>())
            ("b,bperms-groups", "bPermissions groups.yml to read instead of module files",
             cxxopts::value<std::string>())
            ("o,output-modules", "Existing directory to write module files to, one per stem",
             cxxopts::value<std::string>())
            ("p,plugin", "Permissions plugin: LuckPerms or bPermissions",
             cxxopts::value<std::string>())
            ("d,delete", "Delete all groups on the server (and world, if given)")
            ("a,add", "Add all groups on the server (and world, if given)")
            ("u,update", "Send the commands; without this they are only printed")
            ("l,list", "List the combined groups, weights and permissions")
            ("prune-inherited", "Leave out nodes already granted by an ancestor when writing modules")
            ("c,config", "TOML or JSON settings file", cxxopts::value<std::string>())
            ("debug", "Print the effective settings and each loaded file")
            ("h,help", "Show help");

        if (argc == 1) {
            std::cout << options.help() << "\n";
            return 0;
        }

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        LoadOptions load;
        load.defaults = default_settings();
        load.prefix = kEnvPrefix;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();

        const std::vector<std::pair<const char*, const char*>> string_options = {
            {"server", "server"},
            {"input-modules", "input_modules"},
            {"world", "world"},
            {"bperms-groups", "bperms_groups"},
            {"output-modules", "output_modules"},
            {"plugin", "plugin"},
        };
        for (const auto& [flag, key] : string_options) {
            if (result.count(flag)) load.overrides[key] = result[flag].as<std::string>();
        }
        if (result.count("modules")) {
            load.overrides["modules"] = result["modules"].as<std::vector<std::string>>();
        }

        const std::vector<std::pair<const char*, const char*>> bool_options = {
            {"delete", "delete"},
            {"add", "add"},
            {"update", "update"},
            {"list", "list"},
            {"prune-inherited", "prune_inherited"},
            {"debug", "debug"},
        };
        for (const auto& [flag, key] : bool_options) {
            if (result.count(flag)) load.overrides[key] = true;
        }

        Config cfg = Config::load(load);
        RunSettings settings = read_run_settings(cfg);

        if (settings.debug) {
            std::cout << "# settings: " << cfg.to_json_string(-1) << "\n\n";
        }

        // Require a server name if commands will actually be sent.
        if (settings.update && settings.server.empty()) {
            std::cerr << "ERROR: you must specify the server name to send commands (-u/--update)\n";
            return 1;
        }

        ContextModules contexts;
        if (!settings.bperms_groups.empty()) {
            contexts = import_contexts(settings);
        } else {
            if (settings.input_modules.empty()) {
                settings.input_modules = settings.server;
            }
            if (settings.input_modules.empty()) {
                std::cerr << "ERROR: you need to specify a modules path or import from bPermissions\n";
                return 1;
            }
            contexts = load_context_modules(settings.input_modules, settings.world, settings.modules);
        }

        if (settings.debug) {
            for (const auto& [world, modules] : contexts) {
                for (const auto& module : modules) {
                    std::cout << "# loaded " << module.source << " (" << world << ")\n";
                }
            }
        }

        std::vector<std::string> warnings;
        const ContextTrees trees = merge_contexts(contexts, &warnings);
        print_warnings(warnings);
        warnings.clear();

        const std::string selected = settings.world == kAllWorlds ? std::string(kDefaultContext)
                                                                  : settings.world;
        const CombinedTree& tree = trees.at(is_default_context(selected) ? std::string(kDefaultContext)
                                                                         : selected);

        if (settings.list) {
            std::cout << format_listing(tree);
        }

        if (!settings.output_modules.empty()) {
            ExportOptions export_options;
            export_options.prune_inherited = settings.prune_inherited;
            std::vector<std::string> notes;
            const auto modules = export_by_stem(tree, export_options, &notes);
            for (const auto& note : notes) std::cout << "NOTE: " << note << "\n";
            write_module_directory(modules, settings.output_modules);
        }

        Intent intent;
        intent.remove = settings.delete_groups;
        intent.add = settings.add_groups;
        if (!intent.remove && !intent.add) {
            return 0;
        }

        const auto plan = plan_commands(trees, settings.world, intent, settings.traits(), &warnings);
        print_warnings(warnings);

        Dispatcher dispatcher(settings.server, settings.update, std::cout, std::cerr);
        for (const auto& planned : plan) {
            dispatcher.send(planned.command.text);
        }
        return dispatcher.failures() == 0 ? 0 : 1;

    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 1;
    }
}
