/**
 * @file Translate.cpp
 * @brief Phase-ordered command generation
 */

#include "permforge/Translate.hpp"
#include "permforge/Errors.hpp"
#include "permforge/Graph.hpp"

#include <set>

namespace permforge {

namespace {

class Translator {
public:
    Translator(const GroupTree& tree, const std::string& world, const ProfileTraits& traits,
               std::vector<std::string>* warnings)
        : tree_(tree), graph_(tree.groups), world_(world), traits_(traits), warnings_(warnings) {
        for (const auto& group : tree.known_groups()) graph_[group];
    }

    std::vector<Command> run(const Intent& intent, const std::set<GroupName>& to_create) {
        // Fails before anything is rendered if the graph has a cycle.
        const auto creation_order = topological_order(graph_, EdgeDirection::ParentsFirst);

        if (intent.remove) {
            delete_phase();
        }
        if (intent.add) {
            create_phase(creation_order, to_create);
            weight_phase();
            parent_phase();
            permission_phase();
        }
        return std::move(commands_);
    }

private:
    const GroupTree& tree_;
    ParentMap graph_;  // tree_.groups plus an entry for every known group
    const std::string& world_;
    const ProfileTraits& traits_;
    std::vector<std::string>* warnings_;
    std::vector<Command> commands_;

    void emit(CommandKind kind, const GroupName& group, std::map<std::string, std::string> args) {
        args["group"] = group.str();
        commands_.push_back({kind, group.str(), render_command(traits_, kind, world_, args)});
    }

    void delete_phase() {
        std::vector<GroupName> order;
        if (traits_.delete_children_first) {
            order = topological_order(graph_, EdgeDirection::ChildrenFirst);
        } else {
            for (const auto& entry : graph_) order.push_back(entry.first);
        }
        for (const auto& group : order) {
            emit(group.is_builtin_default() ? CommandKind::ClearGroup : CommandKind::DeleteGroup,
                 group, {});
        }
    }

    void create_phase(const std::vector<GroupName>& order, const std::set<GroupName>& to_create) {
        for (const auto& group : order) {
            if (group.is_builtin_default() || to_create.count(group) == 0) continue;
            emit(CommandKind::CreateGroup, group, {});
        }
    }

    void weight_phase() {
        for (const auto& [group, weight] : tree_.weights) {
            if (!traits_.supports_weights) {
                if (warnings_) {
                    warnings_->push_back(traits_.name + " has no group weights; ignoring weight " +
                                         std::to_string(weight) + " of group " + group.str());
                }
                continue;
            }
            emit(CommandKind::SetWeight, group, {{"weight", std::to_string(weight)}});
        }
    }

    void parent_phase() {
        for (const auto& [group, parents] : tree_.groups) {
            for (const auto& parent : parents) {
                emit(CommandKind::AddParent, group, {{"parent", parent.str()}});
            }
        }
    }

    void permission_phase() {
        for (const auto& [group, nodes] : tree_.permissions) {
            for (const auto& node : nodes) {
                if (!is_negated(node)) {
                    emit(CommandKind::AddPermission, group, {{"node", node}, {"value", "true"}});
                    continue;
                }
                switch (traits_.negation) {
                    case NegationStyle::Marker:
                        emit(CommandKind::AddPermission, group, {{"node", node}, {"value", "false"}});
                        break;
                    case NegationStyle::BooleanValue:
                        emit(CommandKind::AddPermission, group,
                             {{"node", strip_negation(node)}, {"value", "false"}});
                        break;
                    case NegationStyle::Unsupported:
                        throw UnsupportedFeatureError(traits_.name, "negated permissions",
                                                      group.str(), node);
                }
            }
        }
    }
};

} // anonymous namespace

std::vector<Command> translate(const CombinedTree& tree, const Intent& intent,
                               const std::string& world, const ProfileTraits& traits,
                               std::vector<std::string>* warnings) {
    return Translator(tree, world, traits, warnings).run(intent, tree.known_groups());
}

std::vector<Command> translate(const DeltaTree& delta, const Intent& intent,
                               const std::string& world, const ProfileTraits& traits,
                               std::vector<std::string>* warnings) {
    return Translator(delta, world, traits, warnings).run(intent, delta.added);
}

} // namespace permforge
