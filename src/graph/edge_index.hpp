/**
 * @file edge_index.hpp
 * @brief Arena-style adjacency index over dependency edges.
 *
 * Edges live in a slot arena; each element id maps to the slots of its
 * outgoing and incoming edges, and a key index maps (source, target, type)
 * to its slot for O(1) duplicate checks. Removal soft-marks a slot dead and
 * recycles it through a free list, so slot numbers held by the adjacency
 * lists never shift. Not synchronized: DependencyGraph owns the locking.
 */

#pragma once

#include "core/types.hpp"
#include "graph/dependency.hpp"

#include <span>
#include <unordered_map>
#include <vector>

namespace taskweave {

class EdgeIndex {
public:
    EdgeIndex() = default;

    // ── Mutation ──────────────────────────────
    /// Insert an edge whose key is not yet present. Returns its slot.
    size_t insert(Dependency dep);
    /// Remove an edge by key. Returns false if it was not present.
    bool erase(const EdgeKey& key);
    /// Remove every edge touching `id`. Returns the removed edges.
    std::vector<Dependency> purge(const ElementId& id);

    // ── Queries ───────────────────────────────
    [[nodiscard]] const Dependency* find(const EdgeKey& key) const;
    [[nodiscard]] Dependency* find(const EdgeKey& key);
    [[nodiscard]] bool contains(const EdgeKey& key) const;

    [[nodiscard]] std::vector<Dependency> outgoing(
        const ElementId& id, std::span<const DependencyType> types = {}) const;
    [[nodiscard]] std::vector<Dependency> incoming(
        const ElementId& id, std::span<const DependencyType> types = {}) const;

    /// Targets of live outgoing edges of `id` whose type belongs to `family`.
    [[nodiscard]] std::vector<ElementId> successors(const ElementId& id, Family family) const;

    [[nodiscard]] std::vector<Dependency> edges() const;
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] size_t slot_capacity() const noexcept;

private:
    struct Slot {
        Dependency dep;
        bool live = false;
    };

    struct Adjacency {
        std::vector<size_t> out;
        std::vector<size_t> in;
    };

    void unlink(size_t slot);

    std::vector<Slot> arena_;
    std::vector<size_t> free_slots_;
    std::unordered_map<EdgeKey, size_t, EdgeKeyHash> by_key_;
    std::unordered_map<ElementId, Adjacency> adjacency_;
};

}  // namespace taskweave
