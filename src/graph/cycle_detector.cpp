/**
 * @file cycle_detector.cpp
 * @brief EdgeList adjacency and whole-set cycle detection.
 */

#include "graph/cycle_detector.hpp"

#include <algorithm>
#include <stack>

namespace taskweave {

// ─────────────────────────────────────────────
// EdgeList
// ─────────────────────────────────────────────

EdgeList::EdgeList(std::span<const Dependency> edges) {
    auto remember = [this](const ElementId& id) {
        if (!out_.contains(id)) {
            out_[id];
            order_.push_back(id);
        }
    };
    for (const auto& dep : edges) {
        remember(dep.source_id);
        remember(dep.target_id);
        out_[dep.source_id].emplace_back(dep.target_id, family_of(dep.type));
    }
}

std::vector<ElementId> EdgeList::successors(const ElementId& id, Family family) const {
    std::vector<ElementId> result;
    auto it = out_.find(id);
    if (it == out_.end()) return result;
    for (const auto& [target, fam] : it->second) {
        if (fam == family) result.push_back(target);
    }
    return result;
}

const std::vector<ElementId>& EdgeList::nodes() const noexcept {
    return order_;
}

// ─────────────────────────────────────────────
// Cycle Checks
// ─────────────────────────────────────────────

bool would_create_cycle(std::span<const Dependency> edges, Family family,
                        const ElementId& source, const ElementId& target) {
    EdgeList list(edges);
    return would_create_cycle(list, family, source, target);
}

std::optional<std::vector<ElementId>> find_cycle_path(std::span<const Dependency> edges,
                                                      Family family) {
    enum class Color : uint8_t { White, Gray, Black };

    EdgeList list(edges);
    std::unordered_map<ElementId, Color> color;
    std::unordered_map<ElementId, ElementId> parent;

    struct Frame {
        ElementId node;
        std::vector<ElementId> neighbors;
        size_t neighbor_idx;
    };

    for (const auto& start_id : list.nodes()) {
        if (color[start_id] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start_id, list.successors(start_id, family), 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.top();

            if (frame.neighbor_idx >= frame.neighbors.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            auto neighbor = frame.neighbors[frame.neighbor_idx++];

            if (color[neighbor] == Color::Gray) {
                // Walk parents back from the current node to the gray neighbor
                std::vector<ElementId> path{neighbor};
                for (auto at = frame.node; at != neighbor; at = parent[at]) {
                    path.push_back(at);
                }
                path.push_back(neighbor);
                std::reverse(path.begin(), path.end());
                return path;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                parent[neighbor] = frame.node;
                auto next = list.successors(neighbor, family);
                dfs_stack.push({std::move(neighbor), std::move(next), 0});
            }
        }
    }

    return std::nullopt;
}

bool has_cycle(std::span<const Dependency> edges, Family family) {
    return find_cycle_path(edges, family).has_value();
}

}  // namespace taskweave
