/**
 * @file derived_state.cpp
 * @brief DerivedState implementation.
 */

#include "derived/derived_state.hpp"

#include <algorithm>
#include <chrono>

namespace taskweave {

namespace {

constexpr std::string_view kComponent = "derived";

constexpr DependencyType kBlockingTypes[] = {DependencyType::Blocks, DependencyType::Awaits};
constexpr DependencyType kContainment[] = {DependencyType::ParentChild};

void sort_by_priority(std::vector<Task>& tasks) {
    std::sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.id < b.id;
    });
}

bool has_unresolved_blocker(const EdgeIndex& index, const IElementStore& store,
                            const ElementId& id, Timestamp now) {
    auto edges = index.incoming(id, kBlockingTypes);
    return std::any_of(edges.begin(), edges.end(), [&](const Dependency& dep) {
        return !is_resolved(store, dep, now);
    });
}

}  // namespace

bool is_resolved(const IElementStore& store, const Dependency& dep, Timestamp now) {
    if (dep.type == DependencyType::Awaits && dep.gate && dep.gate->is_satisfied(now)) {
        return true;
    }

    auto source = store.element(dep.source_id);
    if (!source || source->is_deleted()) return true;

    switch (source->type) {
        case ElementType::Task: {
            auto task = store.task(dep.source_id);
            return !task || is_terminal(task->status);
        }
        case ElementType::Plan: {
            auto plan = store.plan(dep.source_id);
            return !plan || plan->status == PlanStatus::Completed
                || plan->status == PlanStatus::Cancelled;
        }
        case ElementType::Workflow: {
            auto wf = store.workflow(dep.source_id);
            return !wf || wf->status == WorkflowStatus::Completed
                || wf->status == WorkflowStatus::Cancelled;
        }
        default:
            return true;
    }
}

DerivedState::DerivedState(DependencyGraph& graph, Logger* logger, AuditLog* audit)
    : graph_(graph), logger_(logger), audit_(audit) {}

std::pair<std::vector<Task>, std::vector<Task>> DerivedState::partition() const {
    const IElementStore& store = graph_.store();
    auto now = std::chrono::system_clock::now();

    return graph_.with_snapshot([&](const EdgeIndex& index) {
        std::vector<Task> ready;
        std::vector<Task> blocked;
        for (auto& task : store.tasks()) {
            if (task.is_deleted() || is_terminal(task.status)) continue;
            if (has_unresolved_blocker(index, store, task.id, now)) {
                blocked.push_back(std::move(task));
            } else {
                ready.push_back(std::move(task));
            }
        }
        return std::make_pair(std::move(ready), std::move(blocked));
    });
}

std::vector<Task> DerivedState::ready() const {
    auto tasks = partition().first;
    sort_by_priority(tasks);
    return tasks;
}

std::vector<Task> DerivedState::blocked() const {
    auto tasks = partition().second;
    sort_by_priority(tasks);
    return tasks;
}

Result<std::vector<Dependency>> DerivedState::blockers_of(const ElementId& task_id) const {
    const IElementStore& store = graph_.store();
    if (!store.task(task_id)) {
        return Error{ErrorCode::NotFound, "Task not found: " + task_id};
    }

    auto now = std::chrono::system_clock::now();
    return graph_.with_snapshot([&](const EdgeIndex& index) {
        auto edges = index.incoming(task_id, kBlockingTypes);
        std::erase_if(edges, [&](const Dependency& dep) { return is_resolved(store, dep, now); });
        return edges;
    });
}

// ─────────────────────────────────────────────
// Progress
// ─────────────────────────────────────────────

Result<Progress> DerivedState::progress_of(const ElementId& container_id,
                                           ElementType type) const {
    const IElementStore& store = graph_.store();
    auto container = store.element(container_id);
    if (!container || container->is_deleted() || container->type != type) {
        return Error{ErrorCode::NotFound,
                     std::string{to_string(type)} + " not found: " + container_id};
    }

    auto now = std::chrono::system_clock::now();
    Progress progress = graph_.with_snapshot([&](const EdgeIndex& index) {
        Progress p;
        for (const auto& edge : index.incoming(container_id, kContainment)) {
            auto task = store.task(edge.source_id);
            if (!task || task->is_deleted()) continue;

            ++p.total;
            switch (task->status) {
                case TaskStatus::Closed:    ++p.closed; continue;
                case TaskStatus::Cancelled: ++p.cancelled; continue;
                default: break;
            }

            if (has_unresolved_blocker(index, store, task->id, now)) {
                ++p.blocked;
            } else if (task->status == TaskStatus::InProgress) {
                ++p.in_progress;
            } else {
                ++p.open;
            }
        }
        return p;
    });

    size_t denominator = progress.total - progress.cancelled;
    if (denominator > 0) {
        progress.percent_complete =
            100.0 * static_cast<double>(progress.closed) / static_cast<double>(denominator);
    }
    return progress;
}

Result<Progress> DerivedState::plan_progress(const ElementId& plan_id) const {
    return progress_of(plan_id, ElementType::Plan);
}

Result<Progress> DerivedState::workflow_progress(const ElementId& workflow_id) const {
    return progress_of(workflow_id, ElementType::Workflow);
}

// ─────────────────────────────────────────────
// Reconciliation
// ─────────────────────────────────────────────

ReconcileReport DerivedState::reconcile_blocked_status(const EntityId& actor) {
    auto [ready, blocked] = partition();
    IElementStore& store = graph_.store();
    ReconcileReport report;

    auto apply = [&](const Task& task, TaskStatus to, AuditEvent event,
                     std::vector<ElementId>& changed) {
        if (auto updated = store.set_task_status(task.id, to); !updated) {
            if (logger_) {
                logger_->warn(kComponent, "Skipped status write for " + task.id + ": "
                                              + updated.error().message);
            }
            return;
        }
        changed.push_back(task.id);
        if (audit_) audit_->record_status(event, task.id, to_string(task.status), to_string(to), actor);
    };

    for (const auto& task : blocked) {
        if (task.status == TaskStatus::Open) {
            apply(task, TaskStatus::Blocked, AuditEvent::AutoBlocked, report.auto_blocked);
        }
    }
    for (const auto& task : ready) {
        if (task.status == TaskStatus::Blocked) {
            apply(task, TaskStatus::Open, AuditEvent::AutoUnblocked, report.auto_unblocked);
        }
    }

    if (logger_ && (!report.auto_blocked.empty() || !report.auto_unblocked.empty())) {
        logger_->info(kComponent, "Reconciled blocked status: "
                                      + std::to_string(report.auto_blocked.size()) + " blocked, "
                                      + std::to_string(report.auto_unblocked.size()) + " unblocked");
    }
    return report;
}

}  // namespace taskweave
