/**
 * @file element_store.hpp
 * @brief Storage collaborator interface and the in-memory implementation.
 *
 * The graph engine only needs element lookup by id (including soft-delete
 * status), typed field reads and a handful of updates. Durable backends
 * implement IElementStore; InMemoryElementStore backs tests and the CLI.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/elements.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace taskweave {

/**
 * @brief Abstract storage collaborator.
 */
class IElementStore {
public:
    virtual ~IElementStore() = default;

    // ── Insertion ────────────────────────────
    virtual Result<void> insert(Element element) = 0;
    virtual Result<void> insert(Task task) = 0;
    virtual Result<void> insert(Plan plan) = 0;
    virtual Result<void> insert(Workflow workflow) = 0;
    virtual Result<void> insert(Entity entity) = 0;

    // ── Lookup ───────────────────────────────
    [[nodiscard]] virtual std::optional<Element> element(const ElementId& id) const = 0;
    [[nodiscard]] virtual std::optional<Task> task(const ElementId& id) const = 0;
    [[nodiscard]] virtual std::optional<Plan> plan(const ElementId& id) const = 0;
    [[nodiscard]] virtual std::optional<Workflow> workflow(const ElementId& id) const = 0;
    [[nodiscard]] virtual std::optional<Entity> entity(const EntityId& id) const = 0;
    [[nodiscard]] virtual std::vector<Task> tasks() const = 0;
    [[nodiscard]] virtual std::vector<Entity> entities() const = 0;

    // ── Updates ──────────────────────────────
    virtual Result<void> set_task_status(const ElementId& id, TaskStatus status) = 0;
    virtual Result<void> set_plan_status(const ElementId& id, PlanStatus status) = 0;
    virtual Result<void> set_workflow_status(const ElementId& id, WorkflowStatus status) = 0;
    virtual Result<void> set_workflow_ephemeral(const ElementId& id, bool ephemeral) = 0;
    virtual Result<void> set_reports_to(const EntityId& id, std::optional<EntityId> manager) = 0;

    // ── Deletion ─────────────────────────────
    virtual Result<void> soft_delete(const ElementId& id) = 0;
    virtual Result<void> hard_delete(const ElementId& id) = 0;

    /// Exists and is not soft-deleted.
    [[nodiscard]] bool is_live(const ElementId& id) const {
        auto el = element(id);
        return el && !el->is_deleted();
    }
};

/**
 * @brief Thread-safe in-memory element store.
 */
class InMemoryElementStore : public IElementStore {
public:
    InMemoryElementStore() = default;

    Result<void> insert(Element element) override;
    Result<void> insert(Task task) override;
    Result<void> insert(Plan plan) override;
    Result<void> insert(Workflow workflow) override;
    Result<void> insert(Entity entity) override;

    [[nodiscard]] std::optional<Element> element(const ElementId& id) const override;
    [[nodiscard]] std::optional<Task> task(const ElementId& id) const override;
    [[nodiscard]] std::optional<Plan> plan(const ElementId& id) const override;
    [[nodiscard]] std::optional<Workflow> workflow(const ElementId& id) const override;
    [[nodiscard]] std::optional<Entity> entity(const EntityId& id) const override;
    [[nodiscard]] std::vector<Task> tasks() const override;
    [[nodiscard]] std::vector<Entity> entities() const override;

    Result<void> set_task_status(const ElementId& id, TaskStatus status) override;
    Result<void> set_plan_status(const ElementId& id, PlanStatus status) override;
    Result<void> set_workflow_status(const ElementId& id, WorkflowStatus status) override;
    Result<void> set_workflow_ephemeral(const ElementId& id, bool ephemeral) override;
    Result<void> set_reports_to(const EntityId& id, std::optional<EntityId> manager) override;

    Result<void> soft_delete(const ElementId& id) override;
    Result<void> hard_delete(const ElementId& id) override;

    [[nodiscard]] size_t size() const;

private:
    [[nodiscard]] bool contains_locked(const ElementId& id) const;
    Element* header_locked(const ElementId& id);

    std::unordered_map<ElementId, Element> others_;
    std::unordered_map<ElementId, Task> tasks_;
    std::unordered_map<ElementId, Plan> plans_;
    std::unordered_map<ElementId, Workflow> workflows_;
    std::unordered_map<EntityId, Entity> entities_;
    mutable std::shared_mutex mutex_;
};

}  // namespace taskweave
