/**
 * @file dependency.hpp
 * @brief Typed dependency edges, their acyclicity families and awaits gates.
 *
 * DependencyType is a closed enumeration. Every per-type rule (which
 * acyclicity family a type belongs to, its category, whether it is
 * symmetric) is declared once in this header so adding a type means
 * touching a single place.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

// ─────────────────────────────────────────────
// Dependency Type
// ─────────────────────────────────────────────

enum class DependencyType : uint8_t {
    // Blocking
    Blocks,
    Awaits,
    ParentChild,
    // Associative
    RelatesTo,
    References,
    Supersedes,
    Duplicates,
    CausedBy,
    Validates,
    // Attribution
    AuthoredBy,
    AssignedTo,
    ApprovedBy,
    // Threading
    RepliesTo
};

inline constexpr DependencyType kAllDependencyTypes[] = {
    DependencyType::Blocks,     DependencyType::Awaits,     DependencyType::ParentChild,
    DependencyType::RelatesTo,  DependencyType::References, DependencyType::Supersedes,
    DependencyType::Duplicates, DependencyType::CausedBy,   DependencyType::Validates,
    DependencyType::AuthoredBy, DependencyType::AssignedTo, DependencyType::ApprovedBy,
    DependencyType::RepliesTo,
};

[[nodiscard]] constexpr std::string_view to_string(DependencyType type) noexcept {
    switch (type) {
        case DependencyType::Blocks:      return "blocks";
        case DependencyType::Awaits:      return "awaits";
        case DependencyType::ParentChild: return "parent-child";
        case DependencyType::RelatesTo:   return "relates-to";
        case DependencyType::References:  return "references";
        case DependencyType::Supersedes:  return "supersedes";
        case DependencyType::Duplicates:  return "duplicates";
        case DependencyType::CausedBy:    return "caused-by";
        case DependencyType::Validates:   return "validates";
        case DependencyType::AuthoredBy:  return "authored-by";
        case DependencyType::AssignedTo:  return "assigned-to";
        case DependencyType::ApprovedBy:  return "approved-by";
        case DependencyType::RepliesTo:   return "replies-to";
    }
    return "unknown";
}

std::optional<DependencyType> parse_dependency_type(std::string_view text);

// ─────────────────────────────────────────────
// Families & Categories
// ─────────────────────────────────────────────

/**
 * @brief Acyclicity domain of a dependency type.
 *
 * Edges are cycle-checked only against other edges of the same family.
 */
enum class Family : uint8_t {
    None,           ///< Not cycle-checked
    Scheduling,     ///< blocks, awaits
    Containment     ///< parent-child
};

[[nodiscard]] constexpr Family family_of(DependencyType type) noexcept {
    switch (type) {
        case DependencyType::Blocks:
        case DependencyType::Awaits:
            return Family::Scheduling;
        case DependencyType::ParentChild:
            return Family::Containment;
        default:
            return Family::None;
    }
}

[[nodiscard]] constexpr std::string_view to_string(Family family) noexcept {
    switch (family) {
        case Family::None:        return "none";
        case Family::Scheduling:  return "scheduling";
        case Family::Containment: return "containment";
    }
    return "unknown";
}

enum class Category : uint8_t {
    Blocking,
    Associative,
    Attribution,
    Threading
};

[[nodiscard]] constexpr Category category_of(DependencyType type) noexcept {
    switch (type) {
        case DependencyType::Blocks:
        case DependencyType::Awaits:
        case DependencyType::ParentChild:
            return Category::Blocking;
        case DependencyType::AuthoredBy:
        case DependencyType::AssignedTo:
        case DependencyType::ApprovedBy:
            return Category::Attribution;
        case DependencyType::RepliesTo:
            return Category::Threading;
        default:
            return Category::Associative;
    }
}

/// relates-to is the only symmetric type.
[[nodiscard]] constexpr bool is_symmetric(DependencyType type) noexcept {
    return type == DependencyType::RelatesTo;
}

// ─────────────────────────────────────────────
// Awaits Gates
// ─────────────────────────────────────────────

enum class GateType : uint8_t {
    Timer,
    Approval,
    External,
    Webhook
};

[[nodiscard]] constexpr std::string_view to_string(GateType type) noexcept {
    switch (type) {
        case GateType::Timer:    return "timer";
        case GateType::Approval: return "approval";
        case GateType::External: return "external";
        case GateType::Webhook:  return "webhook";
    }
    return "unknown";
}

/**
 * @brief Gate carried by an awaits edge.
 *
 * Only the fields relevant to the gate type are consulted.
 */
struct Gate {
    GateType type = GateType::External;
    std::optional<Timestamp> wait_until;            ///< Timer
    std::vector<EntityId> required_approvers;       ///< Approval
    std::optional<size_t> approval_count;           ///< Approval (defaults to all)
    std::vector<EntityId> current_approvers;        ///< Approval
    bool satisfied = false;                         ///< External / webhook
    std::optional<Timestamp> satisfied_at;
    std::optional<EntityId> satisfied_by;

    [[nodiscard]] bool is_satisfied(Timestamp now) const;
};

// ─────────────────────────────────────────────
// Dependency
// ─────────────────────────────────────────────

using Metadata = std::map<std::string, std::string, std::less<>>;

/**
 * @brief A directed, typed edge.
 *
 * For blocks/awaits the source is the blocker; for parent-child the source
 * is the child and the target is the container.
 */
struct Dependency {
    ElementId source_id;
    ElementId target_id;
    DependencyType type = DependencyType::Blocks;
    Metadata metadata;
    std::optional<Gate> gate;
    EntityId created_by;
    Timestamp created_at{};
};

/**
 * @brief Composite identity of an edge.
 */
struct EdgeKey {
    ElementId source_id;
    ElementId target_id;
    DependencyType type = DependencyType::Blocks;

    bool operator==(const EdgeKey&) const = default;
};

struct EdgeKeyHash {
    size_t operator()(const EdgeKey& key) const noexcept;
};

[[nodiscard]] inline EdgeKey key_of(const Dependency& dep) {
    return EdgeKey{dep.source_id, dep.target_id, dep.type};
}

/// Human-readable "a -> b (blocks)" form used in messages and logs.
std::string describe(const EdgeKey& key);

/// True when the edge's type appears in `types` (an empty span matches all).
[[nodiscard]] bool matches(DependencyType type, std::span<const DependencyType> types);

}  // namespace taskweave
