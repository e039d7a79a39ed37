/**
 * @file derived_state.hpp
 * @brief Read-side view over the graph: ready and blocked tasks, progress.
 *
 * Nothing here is stored. Every query runs inside DependencyGraph's
 * with_snapshot() so it sees one consistent edge set, then reads task
 * fields from the element store (lock order: graph, then store).
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"
#include "storage/elements.hpp"
#include "telemetry/audit_log.hpp"

#include <vector>

namespace taskweave {

/**
 * @brief Task counts over the members of a plan or workflow.
 */
struct Progress {
    size_t total = 0;
    size_t open = 0;
    size_t in_progress = 0;
    size_t blocked = 0;
    size_t closed = 0;
    size_t cancelled = 0;
    double percent_complete = 0.0;   ///< 100 * closed / (total - cancelled)
};

/**
 * @brief Outcome of writing derived blocked status back to the store.
 */
struct ReconcileReport {
    std::vector<ElementId> auto_blocked;
    std::vector<ElementId> auto_unblocked;
};

class DerivedState {
public:
    explicit DerivedState(DependencyGraph& graph,
                          Logger* logger = nullptr,
                          AuditLog* audit = nullptr);

    /// Live, non-terminal tasks with no unresolved blocks/awaits edge.
    /// Sorted by priority, then id.
    [[nodiscard]] std::vector<Task> ready() const;

    /// Live, non-terminal tasks with at least one unresolved blocker.
    [[nodiscard]] std::vector<Task> blocked() const;

    /// The unresolved incoming edges keeping a task blocked.
    [[nodiscard]] Result<std::vector<Dependency>> blockers_of(const ElementId& task_id) const;

    [[nodiscard]] Result<Progress> plan_progress(const ElementId& plan_id) const;
    [[nodiscard]] Result<Progress> workflow_progress(const ElementId& workflow_id) const;

    /**
     * @brief Mirror the derived blocked value into stored task status.
     *
     * Only open <-> blocked transitions are written; in-progress and
     * terminal tasks are left alone.
     */
    ReconcileReport reconcile_blocked_status(const EntityId& actor = EntityId{kSystemActor});

private:
    /// Split live non-terminal tasks into (ready, blocked).
    std::pair<std::vector<Task>, std::vector<Task>> partition() const;
    Result<Progress> progress_of(const ElementId& container_id, ElementType type) const;

    DependencyGraph& graph_;
    Logger* logger_;
    AuditLog* audit_;
};

/**
 * @brief True once a blocks/awaits edge no longer holds its target back.
 *
 * A blocker is resolved when it is missing or soft-deleted, a closed or
 * cancelled task, a completed or cancelled plan/workflow, or any other
 * element type. An awaits edge is also resolved by a satisfied gate.
 */
[[nodiscard]] bool is_resolved(const IElementStore& store, const Dependency& dep, Timestamp now);

}  // namespace taskweave
