/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout TaskWeave.
 *
 * Defines ElementId, EntityId, the element type tag and the status
 * enumerations for tasks, plans and workflows, together with their string
 * forms. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace taskweave {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ElementId = std::string;
using EntityId = std::string;
using Timestamp = std::chrono::system_clock::time_point;

/// Actor recorded when a caller does not name one.
inline constexpr std::string_view kSystemActor = "system";

// ─────────────────────────────────────────────
// Element Type
// ─────────────────────────────────────────────

enum class ElementType : uint8_t {
    Task,
    Plan,
    Workflow,
    Entity,
    Document,
    Channel,
    Message,
    Team,
    Library
};

[[nodiscard]] constexpr std::string_view to_string(ElementType type) noexcept {
    switch (type) {
        case ElementType::Task:     return "task";
        case ElementType::Plan:     return "plan";
        case ElementType::Workflow: return "workflow";
        case ElementType::Entity:   return "entity";
        case ElementType::Document: return "document";
        case ElementType::Channel:  return "channel";
        case ElementType::Message:  return "message";
        case ElementType::Team:     return "team";
        case ElementType::Library:  return "library";
    }
    return "unknown";
}

/// Short prefix used when generating ids for each element type.
[[nodiscard]] constexpr std::string_view id_prefix(ElementType type) noexcept {
    switch (type) {
        case ElementType::Task:     return "tsk";
        case ElementType::Plan:     return "pln";
        case ElementType::Workflow: return "wf";
        case ElementType::Entity:   return "ent";
        case ElementType::Document: return "doc";
        case ElementType::Channel:  return "chn";
        case ElementType::Message:  return "msg";
        case ElementType::Team:     return "team";
        case ElementType::Library:  return "lib";
    }
    return "el";
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Open,
    InProgress,
    Blocked,       ///< Stored mirror of the derived value; may lag the graph
    Closed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Open:       return "open";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Blocked:    return "blocked";
        case TaskStatus::Closed:     return "closed";
        case TaskStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

/// Closed and cancelled tasks no longer participate in scheduling.
[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Closed || status == TaskStatus::Cancelled;
}

std::optional<TaskStatus> parse_task_status(std::string_view text);

// ─────────────────────────────────────────────
// Plan Status
// ─────────────────────────────────────────────

enum class PlanStatus : uint8_t {
    Draft,
    Active,
    Completed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(PlanStatus status) noexcept {
    switch (status) {
        case PlanStatus::Draft:     return "draft";
        case PlanStatus::Active:    return "active";
        case PlanStatus::Completed: return "completed";
        case PlanStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Workflow Status
// ─────────────────────────────────────────────

enum class WorkflowStatus : uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(WorkflowStatus status) noexcept {
    switch (status) {
        case WorkflowStatus::Pending:   return "pending";
        case WorkflowStatus::Running:   return "running";
        case WorkflowStatus::Completed: return "completed";
        case WorkflowStatus::Failed:    return "failed";
        case WorkflowStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Entity Kind
// ─────────────────────────────────────────────

enum class EntityKind : uint8_t {
    Agent,
    Human,
    System
};

[[nodiscard]] constexpr std::string_view to_string(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Agent:  return "agent";
        case EntityKind::Human:  return "human";
        case EntityKind::System: return "system";
    }
    return "unknown";
}

}  // namespace taskweave
