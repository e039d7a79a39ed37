/**
 * @file cycle_detector.hpp
 * @brief Family-scoped reachability checks used before every structural change.
 *
 * would_create_cycle() answers "would inserting source -> target close a
 * cycle among the edges of this family" by searching breadth-first from
 * target for source. It has no side effects and is safe to call
 * speculatively. has_cycle() and find_cycle_path() check a whole edge set
 * with an iterative three-colour DFS.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"
#include "graph/dependency.hpp"

#include <optional>
#include <queue>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace taskweave {

/**
 * @brief Ad-hoc adjacency over a plain edge list.
 *
 * Lets the cycle checks run on edge sets that are not (yet) in a graph
 * store, e.g. the blocks edges a pour is about to persist.
 */
class EdgeList {
public:
    explicit EdgeList(std::span<const Dependency> edges);

    [[nodiscard]] std::vector<ElementId> successors(const ElementId& id, Family family) const;
    [[nodiscard]] const std::vector<ElementId>& nodes() const noexcept;

private:
    std::unordered_map<ElementId, std::vector<std::pair<ElementId, Family>>> out_;
    std::vector<ElementId> order_;      ///< Nodes in first-seen order, for stable output
};

/**
 * @brief True if `source` is reachable from `target` within `family`.
 *
 * A self-loop always counts as a cycle. O(V+E) in the worst case.
 */
template <AdjacencySource G>
[[nodiscard]] bool would_create_cycle(const G& graph, Family family,
                                      const ElementId& source, const ElementId& target) {
    if (source == target) return true;

    std::unordered_set<ElementId> visited{target};
    std::queue<ElementId> frontier;
    frontier.push(target);

    while (!frontier.empty()) {
        auto current = std::move(frontier.front());
        frontier.pop();

        for (auto& next : graph.successors(current, family)) {
            if (next == source) return true;
            if (visited.insert(next).second) {
                frontier.push(std::move(next));
            }
        }
    }
    return false;
}

/// Edge-list convenience overload.
[[nodiscard]] bool would_create_cycle(std::span<const Dependency> edges, Family family,
                                      const ElementId& source, const ElementId& target);

/// True if the edges of `family` contain a directed cycle.
[[nodiscard]] bool has_cycle(std::span<const Dependency> edges, Family family);

/**
 * @brief One directed cycle among the edges of `family`, if any.
 *
 * The returned path starts and ends at the same node.
 */
[[nodiscard]] std::optional<std::vector<ElementId>> find_cycle_path(
    std::span<const Dependency> edges, Family family);

}  // namespace taskweave
