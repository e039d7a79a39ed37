/**
 * @file audit_log.hpp
 * @brief Structured audit events for graph and workflow mutations.
 *
 * The durable event store and its real-time broadcast live outside the
 * engine; this class only emits one NDJSON record per successful mutation
 * into a sink and never reports failure back to the caller.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/dependency.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

namespace taskweave {

enum class AuditEvent : uint8_t {
    ElementCreated,
    ElementDeleted,
    DependencyAdded,
    DependencyRemoved,
    AutoBlocked,
    AutoUnblocked,
    WorkflowPoured,
    WorkflowBurned,
    WorkflowSquashed,
    WorkflowStatusChanged,
    ManagerAssigned
};

[[nodiscard]] constexpr std::string_view to_string(AuditEvent event) noexcept {
    switch (event) {
        case AuditEvent::ElementCreated:        return "element_created";
        case AuditEvent::ElementDeleted:        return "element_deleted";
        case AuditEvent::DependencyAdded:       return "dependency_added";
        case AuditEvent::DependencyRemoved:     return "dependency_removed";
        case AuditEvent::AutoBlocked:           return "auto_blocked";
        case AuditEvent::AutoUnblocked:         return "auto_unblocked";
        case AuditEvent::WorkflowPoured:        return "workflow_poured";
        case AuditEvent::WorkflowBurned:        return "workflow_burned";
        case AuditEvent::WorkflowSquashed:      return "workflow_squashed";
        case AuditEvent::WorkflowStatusChanged: return "workflow_status_changed";
        case AuditEvent::ManagerAssigned:       return "manager_assigned";
    }
    return "unknown";
}

/**
 * @brief Collects and writes audit events as NDJSON.
 */
class AuditLog {
public:
    explicit AuditLog(std::unique_ptr<ILogSink> sink);

    void record_dependency(AuditEvent event, const Dependency& dep, const EntityId& actor);
    void record_element(AuditEvent event, const ElementId& id, ElementType type,
                        const EntityId& actor);
    void record_status(AuditEvent event, const ElementId& id, std::string_view old_status,
                       std::string_view new_status, const EntityId& actor);
    void record_custom(AuditEvent event, const ElementId& id, const EntityId& actor,
                       std::string_view json_payload);

    [[nodiscard]] uint64_t events_recorded() const noexcept;
    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void emit(std::string_view json_line);
};

}  // namespace taskweave
