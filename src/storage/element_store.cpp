/**
 * @file element_store.cpp
 * @brief InMemoryElementStore implementation.
 */

#include "storage/element_store.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace taskweave {

namespace {

Error duplicate_id(const ElementId& id) {
    return Error{ErrorCode::AlreadyExists, "Element already exists: " + id};
}

Error missing(std::string_view what, const ElementId& id) {
    return Error{ErrorCode::NotFound, std::string{what} + " not found: " + id};
}

void touch(Element& el) {
    el.updated_at = std::chrono::system_clock::now();
}

template <typename Map>
auto find_copy(const Map& map, const ElementId& id)
    -> std::optional<typename Map::mapped_type> {
    auto it = map.find(id);
    if (it == map.end()) return std::nullopt;
    return it->second;
}

}  // namespace

// ─────────────────────────────────────────────
// Insertion
// ─────────────────────────────────────────────

Result<void> InMemoryElementStore::insert(Element element) {
    switch (element.type) {
        case ElementType::Task:
        case ElementType::Plan:
        case ElementType::Workflow:
        case ElementType::Entity:
            return Error{ErrorCode::ValidationError,
                         std::string{"Typed element inserted as a bare header: "} + element.id};
        default:
            break;
    }

    std::unique_lock lock(mutex_);
    if (contains_locked(element.id)) return duplicate_id(element.id);
    auto id = element.id;
    others_.emplace(std::move(id), std::move(element));
    return {};
}

Result<void> InMemoryElementStore::insert(Task task) {
    std::unique_lock lock(mutex_);
    if (contains_locked(task.id)) return duplicate_id(task.id);
    task.type = ElementType::Task;
    auto id = task.id;
    tasks_.emplace(std::move(id), std::move(task));
    return {};
}

Result<void> InMemoryElementStore::insert(Plan plan) {
    std::unique_lock lock(mutex_);
    if (contains_locked(plan.id)) return duplicate_id(plan.id);
    plan.type = ElementType::Plan;
    auto id = plan.id;
    plans_.emplace(std::move(id), std::move(plan));
    return {};
}

Result<void> InMemoryElementStore::insert(Workflow workflow) {
    std::unique_lock lock(mutex_);
    if (contains_locked(workflow.id)) return duplicate_id(workflow.id);
    workflow.type = ElementType::Workflow;
    auto id = workflow.id;
    workflows_.emplace(std::move(id), std::move(workflow));
    return {};
}

Result<void> InMemoryElementStore::insert(Entity entity) {
    std::unique_lock lock(mutex_);
    if (contains_locked(entity.id)) return duplicate_id(entity.id);
    entity.type = ElementType::Entity;
    auto id = entity.id;
    entities_.emplace(std::move(id), std::move(entity));
    return {};
}

// ─────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────

std::optional<Element> InMemoryElementStore::element(const ElementId& id) const {
    std::shared_lock lock(mutex_);
    if (auto it = tasks_.find(id); it != tasks_.end()) return static_cast<const Element&>(it->second);
    if (auto it = plans_.find(id); it != plans_.end()) return static_cast<const Element&>(it->second);
    if (auto it = workflows_.find(id); it != workflows_.end()) return static_cast<const Element&>(it->second);
    if (auto it = entities_.find(id); it != entities_.end()) return static_cast<const Element&>(it->second);
    if (auto it = others_.find(id); it != others_.end()) return it->second;
    return std::nullopt;
}

std::optional<Task> InMemoryElementStore::task(const ElementId& id) const {
    std::shared_lock lock(mutex_);
    return find_copy(tasks_, id);
}

std::optional<Plan> InMemoryElementStore::plan(const ElementId& id) const {
    std::shared_lock lock(mutex_);
    return find_copy(plans_, id);
}

std::optional<Workflow> InMemoryElementStore::workflow(const ElementId& id) const {
    std::shared_lock lock(mutex_);
    return find_copy(workflows_, id);
}

std::optional<Entity> InMemoryElementStore::entity(const EntityId& id) const {
    std::shared_lock lock(mutex_);
    return find_copy(entities_, id);
}

std::vector<Task> InMemoryElementStore::tasks() const {
    std::shared_lock lock(mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [_, task] : tasks_) out.push_back(task);
    std::sort(out.begin(), out.end(),
              [](const Task& a, const Task& b) { return a.id < b.id; });
    return out;
}

std::vector<Entity> InMemoryElementStore::entities() const {
    std::shared_lock lock(mutex_);
    std::vector<Entity> out;
    out.reserve(entities_.size());
    for (const auto& [_, entity] : entities_) out.push_back(entity);
    std::sort(out.begin(), out.end(),
              [](const Entity& a, const Entity& b) { return a.id < b.id; });
    return out;
}

// ─────────────────────────────────────────────
// Updates
// ─────────────────────────────────────────────

Result<void> InMemoryElementStore::set_task_status(const ElementId& id, TaskStatus status) {
    std::unique_lock lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return missing("Task", id);
    it->second.status = status;
    touch(it->second);
    return {};
}

Result<void> InMemoryElementStore::set_plan_status(const ElementId& id, PlanStatus status) {
    std::unique_lock lock(mutex_);
    auto it = plans_.find(id);
    if (it == plans_.end()) return missing("Plan", id);
    it->second.status = status;
    touch(it->second);
    return {};
}

Result<void> InMemoryElementStore::set_workflow_status(const ElementId& id, WorkflowStatus status) {
    std::unique_lock lock(mutex_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) return missing("Workflow", id);
    it->second.status = status;
    touch(it->second);
    return {};
}

Result<void> InMemoryElementStore::set_workflow_ephemeral(const ElementId& id, bool ephemeral) {
    std::unique_lock lock(mutex_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) return missing("Workflow", id);
    it->second.ephemeral = ephemeral;
    touch(it->second);
    return {};
}

Result<void> InMemoryElementStore::set_reports_to(const EntityId& id,
                                                  std::optional<EntityId> manager) {
    std::unique_lock lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) return missing("Entity", id);
    it->second.reports_to = std::move(manager);
    touch(it->second);
    return {};
}

// ─────────────────────────────────────────────
// Deletion
// ─────────────────────────────────────────────

Result<void> InMemoryElementStore::soft_delete(const ElementId& id) {
    std::unique_lock lock(mutex_);
    auto* header = header_locked(id);
    if (!header) return missing("Element", id);
    if (!header->deleted_at) {
        header->deleted_at = std::chrono::system_clock::now();
        touch(*header);
    }
    return {};
}

Result<void> InMemoryElementStore::hard_delete(const ElementId& id) {
    std::unique_lock lock(mutex_);
    size_t erased = tasks_.erase(id) + plans_.erase(id) + workflows_.erase(id)
                    + entities_.erase(id) + others_.erase(id);
    if (erased == 0) return missing("Element", id);
    return {};
}

size_t InMemoryElementStore::size() const {
    std::shared_lock lock(mutex_);
    return tasks_.size() + plans_.size() + workflows_.size()
           + entities_.size() + others_.size();
}

bool InMemoryElementStore::contains_locked(const ElementId& id) const {
    return tasks_.contains(id) || plans_.contains(id) || workflows_.contains(id)
           || entities_.contains(id) || others_.contains(id);
}

Element* InMemoryElementStore::header_locked(const ElementId& id) {
    if (auto it = tasks_.find(id); it != tasks_.end()) return &it->second;
    if (auto it = plans_.find(id); it != plans_.end()) return &it->second;
    if (auto it = workflows_.find(id); it != workflows_.end()) return &it->second;
    if (auto it = entities_.find(id); it != entities_.end()) return &it->second;
    if (auto it = others_.find(id); it != others_.end()) return &it->second;
    return nullptr;
}

}  // namespace taskweave
