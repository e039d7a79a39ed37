/**
 * @file reporting.cpp
 * @brief ReportingService implementation.
 */

#include "entity/reporting.hpp"

namespace taskweave {

namespace {

constexpr std::string_view kComponent = "reporting";

std::string join_path(const std::vector<EntityId>& path) {
    std::string out;
    for (const auto& id : path) {
        if (!out.empty()) out += " -> ";
        out += id;
    }
    return out;
}

}  // namespace

ReportingService::ReportingService(IElementStore& store, size_t max_depth,
                                   Logger* logger, AuditLog* audit)
    : store_(store), max_depth_(max_depth), logger_(logger), audit_(audit) {}

Result<Entity> ReportingService::live_entity(const EntityId& id) const {
    auto entity = store_.entity(id);
    if (!entity || entity->is_deleted()) {
        return Error{ErrorCode::NotFound, "Entity not found: " + id};
    }
    return *entity;
}

Result<void> ReportingService::assign_manager(const EntityId& entity_id,
                                              const EntityId& manager_id,
                                              const EntityId& actor) {
    if (entity_id == manager_id) {
        return Error{ErrorCode::ValidationError, "Entity cannot report to itself: " + entity_id};
    }

    std::lock_guard lock(assign_mutex_);

    if (auto entity = live_entity(entity_id); !entity) return entity.error();
    if (auto manager = live_entity(manager_id); !manager) return manager.error();

    auto resolve = [this](const EntityId& id) { return store_.entity(id); };
    auto cycle = detect_reporting_cycle(entity_id, manager_id, resolve);
    if (cycle.has_cycle) {
        if (logger_) {
            logger_->warn(kComponent, "Rejected manager assignment: " + join_path(cycle.path));
        }
        return Error{ErrorCode::ValidationError,
                     "Assignment would create a reporting cycle: " + join_path(cycle.path)};
    }

    if (auto updated = store_.set_reports_to(entity_id, manager_id); !updated) {
        return updated.error();
    }

    if (logger_) logger_->debug(kComponent, entity_id + " now reports to " + manager_id);
    if (audit_) {
        audit_->record_custom(AuditEvent::ManagerAssigned, entity_id, actor,
                              R"({"manager":")" + json_escape(manager_id) + "\"}");
    }
    return {};
}

Result<void> ReportingService::clear_manager(const EntityId& entity_id, const EntityId& actor) {
    std::lock_guard lock(assign_mutex_);

    if (auto entity = live_entity(entity_id); !entity) return entity.error();
    if (auto updated = store_.set_reports_to(entity_id, std::nullopt); !updated) {
        return updated.error();
    }

    if (audit_) {
        audit_->record_custom(AuditEvent::ManagerAssigned, entity_id, actor, R"({"manager":null})");
    }
    return {};
}

std::vector<Entity> ReportingService::direct_reports(const EntityId& manager_id) const {
    std::vector<Entity> reports;
    for (auto& entity : store_.entities()) {
        if (!entity.is_deleted() && entity.reports_to == manager_id) {
            reports.push_back(std::move(entity));
        }
    }
    return reports;
}

Result<std::vector<Entity>> ReportingService::management_chain(const EntityId& entity_id) const {
    auto entity = live_entity(entity_id);
    if (!entity) return entity.error();

    auto resolve = [this](const EntityId& id) { return store_.entity(id); };
    return taskweave::management_chain(*entity, resolve, max_depth_);
}

}  // namespace taskweave
