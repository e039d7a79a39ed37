/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace taskweave {

namespace {

constexpr std::string_view kComponent = "graph";

}  // namespace

DependencyGraph::DependencyGraph(IElementStore& store, GraphOptions options,
                                 Logger* logger, AuditLog* audit)
    : store_(store), options_(options), logger_(logger), audit_(audit) {}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

void DependencyGraph::normalize(EdgeKey& key) const {
    if (options_.normalize_relates_to && is_symmetric(key.type)
        && key.target_id < key.source_id) {
        std::swap(key.source_id, key.target_id);
    }
}

Result<void> DependencyGraph::validate_locked(const Dependency& dep) const {
    auto key = key_of(dep);

    for (const auto* id : {&dep.source_id, &dep.target_id}) {
        auto element = store_.element(*id);
        if (!element) {
            return Error{ErrorCode::NotFound, "Element not found: " + *id};
        }
        if (element->is_deleted()) {
            return Error{ErrorCode::NotFound, "Element is deleted: " + *id};
        }
    }

    if (dep.gate && dep.type != DependencyType::Awaits) {
        return Error{ErrorCode::ValidationError,
                     "Gates are only valid on awaits dependencies: " + describe(key)};
    }

    Family family = family_of(dep.type);
    if (family == Family::None && dep.source_id == dep.target_id) {
        return Error{ErrorCode::ValidationError,
                     "Element cannot depend on itself: " + describe(key)};
    }

    if (index_.contains(key)) {
        return Error{ErrorCode::DuplicateDependency,
                     "Dependency already exists: " + describe(key)};
    }

    if (family != Family::None
        && taskweave::would_create_cycle(index_, family, dep.source_id, dep.target_id)) {
        return Error{ErrorCode::CycleDetected,
                     "Adding dependency would create a cycle: " + describe(key)};
    }

    return {};
}

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

Result<Dependency> DependencyGraph::add_dependency(const ElementId& source,
                                                  const ElementId& target,
                                                  DependencyType type,
                                                  const EntityId& actor,
                                                  Metadata metadata) {
    Dependency dep;
    dep.source_id = source;
    dep.target_id = target;
    dep.type = type;
    dep.metadata = std::move(metadata);
    dep.created_by = actor;
    return add_dependency(std::move(dep));
}

Result<Dependency> DependencyGraph::add_dependency(Dependency dep) {
    EdgeKey key = key_of(dep);
    normalize(key);
    dep.source_id = key.source_id;
    dep.target_id = key.target_id;
    if (dep.created_by.empty()) dep.created_by = EntityId{kSystemActor};
    dep.created_at = std::chrono::system_clock::now();

    {
        std::unique_lock lock(mutex_);
        if (auto valid = validate_locked(dep); !valid) {
            log_warn("Rejected " + describe(key) + ": " + valid.error().message);
            return valid.error();
        }
        index_.insert(dep);
    }

    log_debug("Added " + describe(key));
    if (audit_) audit_->record_dependency(AuditEvent::DependencyAdded, dep, dep.created_by);
    return dep;
}

Result<std::vector<Dependency>> DependencyGraph::add_dependencies(std::vector<Dependency> batch,
                                                                 const EntityId& actor) {
    auto now = std::chrono::system_clock::now();
    for (auto& dep : batch) {
        EdgeKey key = key_of(dep);
        normalize(key);
        dep.source_id = std::move(key.source_id);
        dep.target_id = std::move(key.target_id);
        if (dep.created_by.empty()) dep.created_by = actor;
        dep.created_at = now;
    }

    {
        std::unique_lock lock(mutex_);
        std::vector<EdgeKey> inserted;
        inserted.reserve(batch.size());

        for (const auto& dep : batch) {
            if (auto valid = validate_locked(dep); !valid) {
                for (auto it = inserted.rbegin(); it != inserted.rend(); ++it) {
                    index_.erase(*it);
                }
                log_warn("Rolled back batch of " + std::to_string(batch.size())
                         + " dependencies: " + valid.error().message);
                return valid.error();
            }
            index_.insert(dep);
            inserted.push_back(key_of(dep));
        }
    }

    log_debug("Added batch of " + std::to_string(batch.size()) + " dependencies");
    if (audit_) {
        for (const auto& dep : batch) {
            audit_->record_dependency(AuditEvent::DependencyAdded, dep, actor);
        }
    }
    return batch;
}

Result<void> DependencyGraph::remove_dependency(const ElementId& source,
                                                const ElementId& target,
                                                DependencyType type,
                                                const EntityId& actor) {
    EdgeKey key{source, target, type};
    normalize(key);

    Dependency removed;
    {
        std::unique_lock lock(mutex_);
        const auto* existing = index_.find(key);
        if (!existing) {
            return Error{ErrorCode::NotFound, "Dependency not found: " + describe(key)};
        }
        removed = *existing;
        index_.erase(key);
    }

    log_debug("Removed " + describe(key));
    if (audit_) audit_->record_dependency(AuditEvent::DependencyRemoved, removed, actor);
    return {};
}

size_t DependencyGraph::purge_element(const ElementId& id, const EntityId& actor) {
    std::vector<Dependency> removed;
    {
        std::unique_lock lock(mutex_);
        removed = index_.purge(id);
    }

    if (audit_) {
        for (const auto& dep : removed) {
            audit_->record_dependency(AuditEvent::DependencyRemoved, dep, actor);
        }
    }
    if (!removed.empty()) {
        log_debug("Purged " + std::to_string(removed.size()) + " edges of " + id);
    }
    return removed.size();
}

// ─────────────────────────────────────────────
// Gates
// ─────────────────────────────────────────────

Result<Dependency*> DependencyGraph::find_awaits_locked(const ElementId& source,
                                                       const ElementId& target) {
    EdgeKey key{source, target, DependencyType::Awaits};
    auto* dep = index_.find(key);
    if (!dep) {
        return Error{ErrorCode::NotFound, "Dependency not found: " + describe(key)};
    }
    if (!dep->gate) {
        return Error{ErrorCode::ValidationError, "Dependency has no gate: " + describe(key)};
    }
    return dep;
}

Result<void> DependencyGraph::satisfy_gate(const ElementId& source, const ElementId& target,
                                           const EntityId& actor) {
    std::unique_lock lock(mutex_);
    auto found = find_awaits_locked(source, target);
    if (!found) return found.error();

    Gate& gate = *(*found)->gate;
    if (gate.type != GateType::External && gate.type != GateType::Webhook) {
        return Error{ErrorCode::ValidationError,
                     std::string{"Gate of type "} + std::string{to_string(gate.type)}
                         + " cannot be satisfied manually"};
    }
    gate.satisfied = true;
    gate.satisfied_at = std::chrono::system_clock::now();
    gate.satisfied_by = actor;
    return {};
}

Result<void> DependencyGraph::record_approval(const ElementId& source, const ElementId& target,
                                              const EntityId& approver) {
    std::unique_lock lock(mutex_);
    auto found = find_awaits_locked(source, target);
    if (!found) return found.error();

    Gate& gate = *(*found)->gate;
    if (gate.type != GateType::Approval) {
        return Error{ErrorCode::ValidationError, "Gate is not an approval gate"};
    }
    if (std::find(gate.required_approvers.begin(), gate.required_approvers.end(), approver)
        == gate.required_approvers.end()) {
        return Error{ErrorCode::ValidationError, "Not a required approver: " + approver};
    }
    if (std::find(gate.current_approvers.begin(), gate.current_approvers.end(), approver)
        == gate.current_approvers.end()) {
        gate.current_approvers.push_back(approver);
    }
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<Dependency> DependencyGraph::outgoing(const ElementId& id,
                                                  std::span<const DependencyType> types) const {
    std::shared_lock lock(mutex_);
    return index_.outgoing(id, types);
}

std::vector<Dependency> DependencyGraph::incoming(const ElementId& id,
                                                  std::span<const DependencyType> types) const {
    std::shared_lock lock(mutex_);
    return index_.incoming(id, types);
}

std::optional<Dependency> DependencyGraph::get(const ElementId& source,
                                               const ElementId& target,
                                               DependencyType type) const {
    EdgeKey key{source, target, type};
    normalize(key);
    std::shared_lock lock(mutex_);
    const auto* dep = index_.find(key);
    if (!dep) return std::nullopt;
    return *dep;
}

bool DependencyGraph::exists(const ElementId& source, const ElementId& target,
                             DependencyType type) const {
    EdgeKey key{source, target, type};
    normalize(key);
    std::shared_lock lock(mutex_);
    return index_.contains(key);
}

std::vector<Dependency> DependencyGraph::related_to(const ElementId& id) const {
    constexpr DependencyType kRelates[] = {DependencyType::RelatesTo};
    std::shared_lock lock(mutex_);
    auto result = index_.outgoing(id, kRelates);
    auto in = index_.incoming(id, kRelates);
    result.insert(result.end(), in.begin(), in.end());
    return result;
}

std::vector<Dependency> DependencyGraph::all() const {
    std::shared_lock lock(mutex_);
    return index_.edges();
}

size_t DependencyGraph::edge_count() const {
    std::shared_lock lock(mutex_);
    return index_.size();
}

bool DependencyGraph::would_create_cycle(const ElementId& source, const ElementId& target,
                                         DependencyType type) const {
    Family family = family_of(type);
    if (family == Family::None) return false;
    std::shared_lock lock(mutex_);
    return taskweave::would_create_cycle(index_, family, source, target);
}

// ─────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────

void DependencyGraph::log_debug(std::string_view message) const {
    if (logger_) logger_->debug(kComponent, message);
}

void DependencyGraph::log_warn(std::string_view message) const {
    if (logger_) logger_->warn(kComponent, message);
}

}  // namespace taskweave
