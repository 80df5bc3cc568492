/**
 * @file Graph.cpp
 * @brief Depth-first topological sort over inheritance edges
 */

#include "permforge/Graph.hpp"
#include "permforge/Errors.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>

namespace permforge {

namespace {

enum class Mark { Unvisited, InProgress, Done };

using Adjacency = std::map<GroupName, std::vector<GroupName>>;

/**
 * @brief Edges to follow before emitting a node
 *
 * For ParentsFirst a node waits for its parents; for ChildrenFirst it waits
 * for its children. Every node gets an entry, possibly empty.
 */
Adjacency build_adjacency(const ParentMap& parents, EdgeDirection direction) {
    Adjacency adj;
    for (const auto& [group, group_parents] : parents) {
        adj[group];
        for (const auto& parent : group_parents) {
            adj[parent];
            if (direction == EdgeDirection::ParentsFirst) {
                adj[group].push_back(parent);
            } else {
                adj[parent].push_back(group);
            }
        }
    }
    return adj;
}

class PostOrder {
public:
    PostOrder(const Adjacency& adj, EdgeDirection direction)
        : adj_(adj), direction_(direction) {}

    std::vector<GroupName> run() {
        for (const auto& entry : adj_) {
            if (marks_[entry.first] == Mark::Unvisited) visit(entry.first);
        }
        return std::move(order_);
    }

private:
    const Adjacency& adj_;
    EdgeDirection direction_;
    std::map<GroupName, Mark> marks_;
    std::vector<GroupName> path_;
    std::vector<GroupName> order_;

    void visit(const GroupName& node) {
        marks_[node] = Mark::InProgress;
        path_.push_back(node);
        for (const auto& next : adj_.at(node)) {
            Mark mark = marks_[next];
            if (mark == Mark::InProgress) {
                report_cycle(next);
            }
            if (mark == Mark::Unvisited) {
                visit(next);
            }
        }
        path_.pop_back();
        marks_[node] = Mark::Done;
        order_.push_back(node);
    }

    [[noreturn]] void report_cycle(const GroupName& start) const {
        auto first = std::find(path_.begin(), path_.end(), start);
        std::vector<std::string> cycle;
        for (auto it = first; it != path_.end(); ++it) cycle.push_back(it->str());
        cycle.push_back(start.str());
        // Report along inheritance edges: child -> parent.
        if (direction_ == EdgeDirection::ChildrenFirst) {
            std::reverse(cycle.begin(), cycle.end());
        }
        throw CyclicInheritanceError(std::move(cycle));
    }
};

} // anonymous namespace

std::vector<GroupName> topological_order(const ParentMap& parents, EdgeDirection direction) {
    Adjacency adj = build_adjacency(parents, direction);
    return PostOrder(adj, direction).run();
}

std::vector<GroupName> ancestors_of(const GroupName& group, const ParentMap& parents) {
    std::vector<GroupName> result;
    std::set<GroupName> seen{group};
    std::deque<GroupName> queue{group};
    while (!queue.empty()) {
        GroupName current = queue.front();
        queue.pop_front();
        auto it = parents.find(current);
        if (it == parents.end()) continue;
        for (const auto& parent : it->second) {
            if (seen.insert(parent).second) {
                result.push_back(parent);
                queue.push_back(parent);
            }
        }
    }
    return result;
}

} // namespace permforge
