/**
 * @file edge_index.cpp
 * @brief EdgeIndex implementation.
 */

#include "graph/edge_index.hpp"

#include <algorithm>

namespace taskweave {

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

size_t EdgeIndex::insert(Dependency dep) {
    size_t slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        slot = arena_.size();
        arena_.emplace_back();
    }

    by_key_.emplace(key_of(dep), slot);
    adjacency_[dep.source_id].out.push_back(slot);
    adjacency_[dep.target_id].in.push_back(slot);

    arena_[slot].dep = std::move(dep);
    arena_[slot].live = true;
    return slot;
}

bool EdgeIndex::erase(const EdgeKey& key) {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) return false;

    size_t slot = it->second;
    by_key_.erase(it);
    unlink(slot);
    return true;
}

std::vector<Dependency> EdgeIndex::purge(const ElementId& id) {
    std::vector<Dependency> removed;
    auto adj_it = adjacency_.find(id);
    if (adj_it == adjacency_.end()) return removed;

    std::vector<size_t> slots = adj_it->second.out;
    slots.insert(slots.end(), adj_it->second.in.begin(), adj_it->second.in.end());
    std::sort(slots.begin(), slots.end());
    slots.erase(std::unique(slots.begin(), slots.end()), slots.end());

    for (size_t slot : slots) {
        if (!arena_[slot].live) continue;
        removed.push_back(arena_[slot].dep);
        by_key_.erase(key_of(arena_[slot].dep));
        unlink(slot);
    }
    adjacency_.erase(id);
    return removed;
}

void EdgeIndex::unlink(size_t slot) {
    auto& entry = arena_[slot];
    auto drop = [slot](std::vector<size_t>& list) {
        list.erase(std::remove(list.begin(), list.end(), slot), list.end());
    };

    if (auto it = adjacency_.find(entry.dep.source_id); it != adjacency_.end()) {
        drop(it->second.out);
        if (it->second.out.empty() && it->second.in.empty()) adjacency_.erase(it);
    }
    if (auto it = adjacency_.find(entry.dep.target_id); it != adjacency_.end()) {
        drop(it->second.in);
        if (it->second.out.empty() && it->second.in.empty()) adjacency_.erase(it);
    }

    entry.live = false;
    entry.dep = Dependency{};
    free_slots_.push_back(slot);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

const Dependency* EdgeIndex::find(const EdgeKey& key) const {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) return nullptr;
    return &arena_[it->second].dep;
}

Dependency* EdgeIndex::find(const EdgeKey& key) {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) return nullptr;
    return &arena_[it->second].dep;
}

bool EdgeIndex::contains(const EdgeKey& key) const {
    return by_key_.contains(key);
}

std::vector<Dependency> EdgeIndex::outgoing(const ElementId& id,
                                            std::span<const DependencyType> types) const {
    std::vector<Dependency> result;
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return result;

    for (size_t slot : it->second.out) {
        const auto& entry = arena_[slot];
        if (entry.live && matches(entry.dep.type, types)) result.push_back(entry.dep);
    }
    return result;
}

std::vector<Dependency> EdgeIndex::incoming(const ElementId& id,
                                            std::span<const DependencyType> types) const {
    std::vector<Dependency> result;
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return result;

    for (size_t slot : it->second.in) {
        const auto& entry = arena_[slot];
        if (entry.live && matches(entry.dep.type, types)) result.push_back(entry.dep);
    }
    return result;
}

std::vector<ElementId> EdgeIndex::successors(const ElementId& id, Family family) const {
    std::vector<ElementId> result;
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return result;

    for (size_t slot : it->second.out) {
        const auto& entry = arena_[slot];
        if (entry.live && family_of(entry.dep.type) == family) {
            result.push_back(entry.dep.target_id);
        }
    }
    return result;
}

std::vector<Dependency> EdgeIndex::edges() const {
    std::vector<Dependency> result;
    result.reserve(by_key_.size());
    for (const auto& entry : arena_) {
        if (entry.live) result.push_back(entry.dep);
    }
    return result;
}

size_t EdgeIndex::size() const noexcept {
    return by_key_.size();
}

size_t EdgeIndex::slot_capacity() const noexcept {
    return arena_.size();
}

}  // namespace taskweave
