/**
 * @file id_generator.hpp
 * @brief Type-prefixed element id generation.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace taskweave {

/**
 * @brief Generates ids of the form "<prefix>-<8 hex digits>".
 *
 * Seedable so tests can reproduce id sequences. Child ids ("wf-1a2b3c4d.3")
 * are derived from a parent id and are stable for a given index.
 */
class IdGenerator {
public:
    IdGenerator();
    explicit IdGenerator(uint64_t seed);

    ElementId next(ElementType type);

    static ElementId child_id(const ElementId& parent, size_t index);

private:
    std::mt19937_64 rng_;
    std::mutex mutex_;
};

}  // namespace taskweave
