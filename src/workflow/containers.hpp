/**
 * @file containers.hpp
 * @brief Plan and workflow membership on top of the graph store.
 *
 * Membership is a parent-child edge from task to container. This layer
 * owns the rules the graph store is deliberately unaware of: a container
 * always holds at least one live task, a task belongs to at most one
 * container, pour output is persisted all-or-nothing, and ephemeral
 * workflows can be burned or squashed.
 */

#pragma once

#include "core/id_generator.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"
#include "storage/elements.hpp"
#include "telemetry/audit_log.hpp"
#include "workflow/pour.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

class ContainerService {
public:
    ContainerService(DependencyGraph& graph, IdGenerator& ids,
                     Logger* logger = nullptr, AuditLog* audit = nullptr);

    // ── Membership ────────────────────────────
    Result<Plan> create_plan(std::string title, const std::vector<ElementId>& task_ids,
                             const EntityId& actor = EntityId{kSystemActor});
    Result<void> add_task(const ElementId& container_id, const ElementId& task_id,
                          const EntityId& actor = EntityId{kSystemActor});
    Result<void> remove_task(const ElementId& container_id, const ElementId& task_id,
                             const EntityId& actor = EntityId{kSystemActor});

    /// Live member tasks, ordered by id.
    [[nodiscard]] Result<std::vector<Task>> members(const ElementId& container_id) const;
    /// The plan or workflow a task belongs to, if any.
    [[nodiscard]] std::optional<ElementId> container_of(const ElementId& task_id) const;

    // ── Workflows ─────────────────────────────
    /**
     * @brief Store a pour result: workflow, tasks, then every edge as one batch.
     *
     * On any failure everything this call stored is deleted again.
     */
    Result<Workflow> persist_pour(const PourResult& poured,
                                  const EntityId& actor = EntityId{kSystemActor});

    /// Hard-delete a workflow, its tasks and every edge touching them.
    /// Durable workflows require `force`. Returns the number of tasks deleted.
    Result<size_t> burn_workflow(const ElementId& workflow_id, bool force = false,
                                 const EntityId& actor = EntityId{kSystemActor});

    /// Promote an ephemeral workflow to durable. One-way.
    Result<void> squash_workflow(const ElementId& workflow_id,
                                 const EntityId& actor = EntityId{kSystemActor});

    /**
     * @brief Apply status auto-transitions from the member tasks.
     *
     * pending/running with a deleted task -> failed; pending with a task in
     * progress -> running; running with every task closed -> completed.
     * Returns the (possibly unchanged) status.
     */
    Result<WorkflowStatus> sync_workflow_status(const ElementId& workflow_id,
                                                const EntityId& actor = EntityId{kSystemActor});

private:
    Result<Element> live_container(const ElementId& id) const;
    /// Member tasks including soft-deleted ones.
    std::vector<Task> all_members(const ElementId& container_id) const;
    void rollback(const std::vector<ElementId>& stored);

    DependencyGraph& graph_;
    IElementStore& store_;
    IdGenerator& ids_;
    Logger* logger_;
    AuditLog* audit_;
    std::mutex membership_mutex_;   ///< Held by every mutation, pour persistence included
};

}  // namespace taskweave
