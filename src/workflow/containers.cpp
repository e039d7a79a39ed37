/**
 * @file containers.cpp
 * @brief ContainerService implementation.
 */

#include "workflow/containers.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace taskweave {

namespace {

constexpr std::string_view kComponent = "containers";
constexpr DependencyType kContainment[] = {DependencyType::ParentChild};

bool is_container(ElementType type) {
    return type == ElementType::Plan || type == ElementType::Workflow;
}

}  // namespace

ContainerService::ContainerService(DependencyGraph& graph, IdGenerator& ids,
                                   Logger* logger, AuditLog* audit)
    : graph_(graph), store_(graph.store()), ids_(ids), logger_(logger), audit_(audit) {}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Result<Element> ContainerService::live_container(const ElementId& id) const {
    auto element = store_.element(id);
    if (!element || element->is_deleted() || !is_container(element->type)) {
        return Error{ErrorCode::NotFound, "Plan or workflow not found: " + id};
    }
    return *element;
}

std::vector<Task> ContainerService::all_members(const ElementId& container_id) const {
    std::vector<Task> tasks;
    for (const auto& edge : graph_.incoming(container_id, kContainment)) {
        if (auto task = store_.task(edge.source_id)) {
            tasks.push_back(std::move(*task));
        }
    }
    std::sort(tasks.begin(), tasks.end(),
              [](const Task& a, const Task& b) { return a.id < b.id; });
    return tasks;
}

std::optional<ElementId> ContainerService::container_of(const ElementId& task_id) const {
    for (const auto& edge : graph_.outgoing(task_id, kContainment)) {
        auto target = store_.element(edge.target_id);
        if (target && is_container(target->type)) return edge.target_id;
    }
    return std::nullopt;
}

void ContainerService::rollback(const std::vector<ElementId>& stored) {
    for (auto it = stored.rbegin(); it != stored.rend(); ++it) {
        graph_.purge_element(*it);
        if (auto removed = store_.hard_delete(*it); !removed && logger_) {
            logger_->error(kComponent, "Rollback could not delete " + *it + ": "
                                           + removed.error().message);
        }
    }
}

// ─────────────────────────────────────────────
// Membership
// ─────────────────────────────────────────────

Result<Plan> ContainerService::create_plan(std::string title,
                                           const std::vector<ElementId>& task_ids,
                                           const EntityId& actor) {
    if (task_ids.empty()) {
        return Error{ErrorCode::ValidationError, "A plan requires at least one task"};
    }

    std::lock_guard lock(membership_mutex_);

    std::unordered_set<ElementId> unique;
    for (const auto& id : task_ids) {
        if (!unique.insert(id).second) {
            return Error{ErrorCode::ValidationError, "Task listed twice: " + id};
        }
        auto task = store_.task(id);
        if (!task || task->is_deleted()) {
            return Error{ErrorCode::NotFound, "Task not found: " + id};
        }
        if (auto owner = container_of(id)) {
            return Error{ErrorCode::AlreadyExists, "Task " + id + " already belongs to " + *owner};
        }
    }

    Plan plan;
    static_cast<Element&>(plan) =
        make_header(ids_.next(ElementType::Plan), ElementType::Plan, std::move(title), actor);
    if (auto stored = store_.insert(plan); !stored) return stored.error();

    std::vector<Dependency> edges;
    edges.reserve(task_ids.size());
    for (const auto& id : task_ids) {
        Dependency edge;
        edge.source_id = id;
        edge.target_id = plan.id;
        edge.type = DependencyType::ParentChild;
        edges.push_back(std::move(edge));
    }
    if (auto linked = graph_.add_dependencies(std::move(edges), actor); !linked) {
        rollback({plan.id});
        return linked.error();
    }

    if (logger_) {
        logger_->info(kComponent, std::format("Created plan {} with {} tasks", plan.id,
                                              task_ids.size()));
    }
    if (audit_) audit_->record_element(AuditEvent::ElementCreated, plan.id, ElementType::Plan, actor);
    return plan;
}

Result<void> ContainerService::add_task(const ElementId& container_id, const ElementId& task_id,
                                        const EntityId& actor) {
    std::lock_guard lock(membership_mutex_);

    if (auto container = live_container(container_id); !container) return container.error();
    auto task = store_.task(task_id);
    if (!task || task->is_deleted()) {
        return Error{ErrorCode::NotFound, "Task not found: " + task_id};
    }
    if (auto owner = container_of(task_id)) {
        return Error{ErrorCode::AlreadyExists, "Task " + task_id + " already belongs to " + *owner};
    }

    auto added = graph_.add_dependency(task_id, container_id, DependencyType::ParentChild, actor);
    if (!added) return added.error();
    return {};
}

Result<void> ContainerService::remove_task(const ElementId& container_id,
                                           const ElementId& task_id,
                                           const EntityId& actor) {
    std::lock_guard lock(membership_mutex_);

    if (auto container = live_container(container_id); !container) return container.error();
    if (!graph_.exists(task_id, container_id, DependencyType::ParentChild)) {
        return Error{ErrorCode::NotFound, "Task " + task_id + " is not in " + container_id};
    }

    auto members = all_members(container_id);
    auto live = std::count_if(members.begin(), members.end(),
                              [](const Task& t) { return !t.is_deleted(); });
    bool removing_live = store_.is_live(task_id);
    if (removing_live && live <= 1) {
        if (logger_) {
            logger_->warn(kComponent, "Refused to remove last task " + task_id + " of "
                                          + container_id);
        }
        return Error{ErrorCode::ValidationError,
                     "Cannot remove the last task from " + container_id};
    }

    return graph_.remove_dependency(task_id, container_id, DependencyType::ParentChild, actor);
}

Result<std::vector<Task>> ContainerService::members(const ElementId& container_id) const {
    if (auto container = live_container(container_id); !container) return container.error();
    auto tasks = all_members(container_id);
    std::erase_if(tasks, [](const Task& t) { return t.is_deleted(); });
    return tasks;
}

// ─────────────────────────────────────────────
// Workflows
// ─────────────────────────────────────────────

Result<Workflow> ContainerService::persist_pour(const PourResult& poured, const EntityId& actor) {
    std::lock_guard lock(membership_mutex_);

    std::vector<ElementId> stored;
    stored.reserve(poured.tasks.size() + 1);

    if (auto inserted = store_.insert(poured.workflow); !inserted) return inserted.error();
    stored.push_back(poured.workflow.id);

    for (const auto& entry : poured.tasks) {
        if (auto inserted = store_.insert(entry.task); !inserted) {
            rollback(stored);
            return inserted.error();
        }
        stored.push_back(entry.task.id);
    }

    std::vector<Dependency> edges = poured.blocks_dependencies;
    edges.insert(edges.end(), poured.parent_child_dependencies.begin(),
                 poured.parent_child_dependencies.end());
    if (auto linked = graph_.add_dependencies(std::move(edges), actor); !linked) {
        if (logger_) {
            logger_->warn(kComponent, "Pour of " + poured.workflow.id + " rolled back: "
                                          + linked.error().message);
        }
        rollback(stored);
        return linked.error();
    }

    if (logger_) {
        logger_->info(kComponent, std::format("Poured workflow {} ({} tasks, {} skipped)",
                                              poured.workflow.id, poured.tasks.size(),
                                              poured.skipped_steps.size()));
    }
    if (audit_) {
        audit_->record_custom(AuditEvent::WorkflowPoured, poured.workflow.id, actor,
                              std::format(R"({{"playbook":"{}","tasks":{},"skipped":{}}})",
                                          json_escape(poured.workflow.playbook_id.value_or("")),
                                          poured.tasks.size(), poured.skipped_steps.size()));
    }
    return poured.workflow;
}

Result<size_t> ContainerService::burn_workflow(const ElementId& workflow_id, bool force,
                                               const EntityId& actor) {
    std::lock_guard lock(membership_mutex_);

    auto workflow = store_.workflow(workflow_id);
    if (!workflow) {
        return Error{ErrorCode::NotFound, "Workflow not found: " + workflow_id};
    }
    if (!workflow->ephemeral && !force) {
        return Error{ErrorCode::ValidationError,
                     "Workflow " + workflow_id + " is durable; burning it requires force"};
    }

    auto tasks = all_members(workflow_id);
    for (const auto& task : tasks) {
        graph_.purge_element(task.id, actor);
        if (auto removed = store_.hard_delete(task.id); !removed) return removed.error();
        if (audit_) audit_->record_element(AuditEvent::ElementDeleted, task.id, ElementType::Task, actor);
    }
    graph_.purge_element(workflow_id, actor);
    if (auto removed = store_.hard_delete(workflow_id); !removed) return removed.error();

    if (logger_) {
        logger_->info(kComponent, std::format("Burned workflow {} ({} tasks)", workflow_id,
                                              tasks.size()));
    }
    if (audit_) {
        audit_->record_element(AuditEvent::WorkflowBurned, workflow_id, ElementType::Workflow, actor);
    }
    return tasks.size();
}

Result<void> ContainerService::squash_workflow(const ElementId& workflow_id,
                                               const EntityId& actor) {
    std::lock_guard lock(membership_mutex_);

    auto workflow = store_.workflow(workflow_id);
    if (!workflow || workflow->is_deleted()) {
        return Error{ErrorCode::NotFound, "Workflow not found: " + workflow_id};
    }
    if (!workflow->ephemeral) {
        return Error{ErrorCode::ValidationError, "Workflow " + workflow_id + " is already durable"};
    }
    if (auto updated = store_.set_workflow_ephemeral(workflow_id, false); !updated) {
        return updated.error();
    }

    if (audit_) {
        audit_->record_element(AuditEvent::WorkflowSquashed, workflow_id, ElementType::Workflow,
                               actor);
    }
    return {};
}

Result<WorkflowStatus> ContainerService::sync_workflow_status(const ElementId& workflow_id,
                                                              const EntityId& actor) {
    std::lock_guard lock(membership_mutex_);

    auto workflow = store_.workflow(workflow_id);
    if (!workflow || workflow->is_deleted()) {
        return Error{ErrorCode::NotFound, "Workflow not found: " + workflow_id};
    }

    auto tasks = all_members(workflow_id);
    WorkflowStatus current = workflow->status;
    WorkflowStatus next = current;

    bool any_deleted = std::any_of(tasks.begin(), tasks.end(),
                                   [](const Task& t) { return t.is_deleted(); });
    bool any_started = std::any_of(tasks.begin(), tasks.end(),
                                   [](const Task& t) { return t.status == TaskStatus::InProgress; });
    bool all_closed = !tasks.empty()
        && std::all_of(tasks.begin(), tasks.end(),
                       [](const Task& t) { return t.status == TaskStatus::Closed; });

    if ((current == WorkflowStatus::Pending || current == WorkflowStatus::Running) && any_deleted) {
        next = WorkflowStatus::Failed;
    } else if (current == WorkflowStatus::Pending && any_started) {
        next = WorkflowStatus::Running;
    } else if (current == WorkflowStatus::Running && all_closed) {
        next = WorkflowStatus::Completed;
    }

    if (next == current) return current;

    if (auto updated = store_.set_workflow_status(workflow_id, next); !updated) {
        return updated.error();
    }
    if (logger_) {
        logger_->info(kComponent, std::format("Workflow {} {} -> {}", workflow_id,
                                              to_string(current), to_string(next)));
    }
    if (audit_) {
        audit_->record_status(AuditEvent::WorkflowStatusChanged, workflow_id, to_string(current),
                              to_string(next), actor);
    }
    return next;
}

}  // namespace taskweave
