/**
 * @file dependency_graph.hpp
 * @brief Dependency graph store: the single path for edge mutations.
 *
 * Every insertion runs the same validation sequence (element existence,
 * duplicate check, family-scoped cycle check) inside one exclusive critical
 * section, so two racing insertions can never both create a duplicate or
 * both close a cycle. Readers take a shared lock; with_snapshot() hands a
 * consistent EdgeIndex to multi-step readers such as the derived-state
 * calculator. The store is invariant-agnostic with respect to plans and
 * workflows: the "last task" rule lives in ContainerService.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/cycle_detector.hpp"
#include "graph/dependency.hpp"
#include "graph/edge_index.hpp"
#include "storage/element_store.hpp"
#include "telemetry/audit_log.hpp"

#include <shared_mutex>
#include <span>
#include <utility>
#include <vector>

namespace taskweave {

struct GraphOptions {
    bool normalize_relates_to = true;
};

class DependencyGraph {
public:
    explicit DependencyGraph(IElementStore& store,
                             GraphOptions options = {},
                             Logger* logger = nullptr,
                             AuditLog* audit = nullptr);

    // Non-copyable, non-movable
    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    // ── Mutation ──────────────────────────────
    Result<Dependency> add_dependency(const ElementId& source,
                                      const ElementId& target,
                                      DependencyType type,
                                      const EntityId& actor = EntityId{kSystemActor},
                                      Metadata metadata = {});

    /// Full form: carries metadata, an optional awaits gate and created_by.
    Result<Dependency> add_dependency(Dependency dep);

    /**
     * @brief Insert a batch atomically.
     *
     * Each edge is validated against the graph plus the batch edges before
     * it. If any edge is rejected, every edge already inserted by this call
     * is rolled back and the first error is returned.
     */
    Result<std::vector<Dependency>> add_dependencies(std::vector<Dependency> batch,
                                                     const EntityId& actor);

    Result<void> remove_dependency(const ElementId& source,
                                   const ElementId& target,
                                   DependencyType type,
                                   const EntityId& actor = EntityId{kSystemActor});

    /// Remove every edge touching an element. Returns the number removed.
    size_t purge_element(const ElementId& id, const EntityId& actor = EntityId{kSystemActor});

    // ── Gates ─────────────────────────────────
    /// Mark an external/webhook gate on an awaits edge as satisfied.
    Result<void> satisfy_gate(const ElementId& source, const ElementId& target,
                              const EntityId& actor);
    /// Record an approval on an approval gate.
    Result<void> record_approval(const ElementId& source, const ElementId& target,
                                 const EntityId& approver);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::vector<Dependency> outgoing(
        const ElementId& id, std::span<const DependencyType> types = {}) const;
    [[nodiscard]] std::vector<Dependency> incoming(
        const ElementId& id, std::span<const DependencyType> types = {}) const;
    [[nodiscard]] std::optional<Dependency> get(const ElementId& source,
                                                const ElementId& target,
                                                DependencyType type) const;
    [[nodiscard]] bool exists(const ElementId& source, const ElementId& target,
                              DependencyType type) const;
    /// relates-to edges in either direction.
    [[nodiscard]] std::vector<Dependency> related_to(const ElementId& id) const;
    [[nodiscard]] std::vector<Dependency> all() const;
    [[nodiscard]] size_t edge_count() const;

    /// Speculative check: would source -> target close a cycle in its family?
    [[nodiscard]] bool would_create_cycle(const ElementId& source, const ElementId& target,
                                          DependencyType type) const;

    /// Run a reader against a consistent view of the edge set.
    template <typename F>
    auto with_snapshot(F&& reader) const {
        std::shared_lock lock(mutex_);
        return std::forward<F>(reader)(std::as_const(index_));
    }

    [[nodiscard]] IElementStore& store() noexcept { return store_; }
    [[nodiscard]] const IElementStore& store() const noexcept { return store_; }

private:
    /// Apply relates-to normalization to a key in place.
    void normalize(EdgeKey& key) const;
    /// Validation sequence; caller holds the exclusive lock.
    Result<void> validate_locked(const Dependency& dep) const;
    Result<Dependency*> find_awaits_locked(const ElementId& source, const ElementId& target);

    void log_debug(std::string_view message) const;
    void log_warn(std::string_view message) const;

    IElementStore& store_;
    GraphOptions options_;
    Logger* logger_;
    AuditLog* audit_;
    EdgeIndex index_;
    mutable std::shared_mutex mutex_;
};

}  // namespace taskweave
