/**
 * @file reporting.hpp
 * @brief Entity management hierarchy: chain walks and cycle checks.
 *
 * reports_to forms its own structure, separate from the dependency graph.
 * The walks are templates over an EntityResolver so they run against the
 * element store or a plain map. Both stop after max_depth steps or on the
 * first revisited entity, so a cycle already present in stored data never
 * makes them loop.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/element_store.hpp"
#include "storage/elements.hpp"
#include "telemetry/audit_log.hpp"

#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace taskweave {

inline constexpr size_t kDefaultChainDepth = 100;

/**
 * @brief Managers of `entity`, nearest first.
 */
template <EntityResolver R>
[[nodiscard]] std::vector<Entity> management_chain(const Entity& entity, R&& resolve,
                                                   size_t max_depth = kDefaultChainDepth) {
    std::vector<Entity> chain;
    std::unordered_set<EntityId> seen{entity.id};
    std::optional<EntityId> next = entity.reports_to;

    while (next && chain.size() < max_depth) {
        if (!seen.insert(*next).second) break;
        std::optional<Entity> manager = resolve(*next);
        if (!manager) break;
        next = manager->reports_to;
        chain.push_back(std::move(*manager));
    }
    return chain;
}

struct ReportingCycle {
    bool has_cycle = false;
    std::vector<EntityId> path;     ///< entity -> proposed manager -> ... -> entity
};

/**
 * @brief Would making `proposed_manager_id` the manager of `entity_id` close a cycle?
 *
 * Walks upward from the proposed manager looking for `entity_id`. The walk
 * has no depth cap; the visited set bounds it.
 */
template <EntityResolver R>
[[nodiscard]] ReportingCycle detect_reporting_cycle(const EntityId& entity_id,
                                                    const EntityId& proposed_manager_id,
                                                    R&& resolve) {
    ReportingCycle result;
    std::vector<EntityId> path{entity_id};
    std::unordered_set<EntityId> seen;
    std::optional<EntityId> current = proposed_manager_id;

    while (current) {
        path.push_back(*current);
        if (*current == entity_id) {
            result.has_cycle = true;
            result.path = std::move(path);
            return result;
        }
        if (!seen.insert(*current).second) break;

        std::optional<Entity> manager = resolve(*current);
        if (!manager) break;
        current = manager->reports_to;
    }
    return result;
}

/**
 * @brief Write path for reports_to, backed by the element store.
 *
 * Assignments are serialized so the cycle check and the write are one
 * step.
 */
class ReportingService {
public:
    explicit ReportingService(IElementStore& store,
                              size_t max_depth = kDefaultChainDepth,
                              Logger* logger = nullptr,
                              AuditLog* audit = nullptr);

    Result<void> assign_manager(const EntityId& entity_id, const EntityId& manager_id,
                                const EntityId& actor = EntityId{kSystemActor});
    Result<void> clear_manager(const EntityId& entity_id,
                               const EntityId& actor = EntityId{kSystemActor});

    [[nodiscard]] std::vector<Entity> direct_reports(const EntityId& manager_id) const;
    [[nodiscard]] Result<std::vector<Entity>> management_chain(const EntityId& entity_id) const;

private:
    Result<Entity> live_entity(const EntityId& id) const;

    IElementStore& store_;
    size_t max_depth_;
    Logger* logger_;
    AuditLog* audit_;
    std::mutex assign_mutex_;
};

}  // namespace taskweave
