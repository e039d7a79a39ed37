/**
 * @file elements.hpp
 * @brief Element records: the common header plus task, plan, workflow and entity.
 *
 * Elements of the remaining types (document, channel, message, team,
 * library) carry fields irrelevant to the graph and are stored as the plain
 * Element header.
 */

#pragma once

#include "core/types.hpp"
#include "core/variables.hpp"

#include <optional>
#include <set>
#include <string>

namespace taskweave {

/**
 * @brief Fields shared by every addressable work item.
 */
struct Element {
    ElementId id;
    ElementType type = ElementType::Document;
    std::string title;
    Timestamp created_at{};
    Timestamp updated_at{};
    EntityId created_by;
    std::set<std::string> tags;
    std::optional<Timestamp> deleted_at;        ///< Soft delete marker

    [[nodiscard]] bool is_deleted() const noexcept { return deleted_at.has_value(); }
};

inline constexpr int kDefaultPriority = 3;      ///< 1 = highest, 5 = lowest

struct Task : Element {
    TaskStatus status = TaskStatus::Open;
    int priority = kDefaultPriority;
    std::string description;
    std::string task_type = "task";
    std::optional<EntityId> assignee;
};

struct Plan : Element {
    PlanStatus status = PlanStatus::Draft;
};

struct Workflow : Element {
    WorkflowStatus status = WorkflowStatus::Pending;
    bool ephemeral = false;
    VariableMap variables;
    std::optional<std::string> playbook_id;
};

struct Entity : Element {
    std::string name;
    EntityKind kind = EntityKind::Agent;
    std::optional<EntityId> reports_to;
};

/// Build an Element header stamped with the current time.
Element make_header(ElementId id, ElementType type, std::string title, EntityId created_by);

}  // namespace taskweave
