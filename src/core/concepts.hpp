/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for TaskWeave interfaces.
 *
 * Defines compile-time interface constraints for the read-path algorithms
 * (cycle detection, management-chain walks). These run on every mutation or
 * query, so they are templates over their data source rather than virtual.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <optional>
#include <vector>

namespace taskweave {

// Forward declarations
enum class Family : uint8_t;
struct Entity;

// ─────────────────────────────────────────────
// AdjacencySource
// ─────────────────────────────────────────────

/**
 * @concept AdjacencySource
 * @brief Constrains types that can enumerate successors within a family.
 *
 * Satisfied by EdgeIndex (the live graph) and by EdgeList (an ad-hoc edge
 * set used for speculative checks and tests).
 */
template <typename T>
concept AdjacencySource = requires(const T& graph, const ElementId& id, Family family) {
    { graph.successors(id, family) } -> std::convertible_to<std::vector<ElementId>>;
};

// ─────────────────────────────────────────────
// EntityResolver
// ─────────────────────────────────────────────

/**
 * @concept EntityResolver
 * @brief Callable that looks an entity up by id.
 *
 * Management-chain walks take the resolver as a parameter so they can run
 * against the element store, a snapshot, or a plain map in tests.
 */
template <typename F>
concept EntityResolver = requires(F resolve, const EntityId& id) {
    { resolve(id) } -> std::convertible_to<std::optional<Entity>>;
};

}  // namespace taskweave
