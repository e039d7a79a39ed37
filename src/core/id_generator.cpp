/**
 * @file id_generator.cpp
 * @brief IdGenerator implementation.
 */

#include "core/id_generator.hpp"

#include <format>

namespace taskweave {

IdGenerator::IdGenerator() : rng_(std::random_device{}()) {}

IdGenerator::IdGenerator(uint64_t seed) : rng_(seed) {}

ElementId IdGenerator::next(ElementType type) {
    uint32_t suffix = 0;
    {
        std::lock_guard lock(mutex_);
        suffix = static_cast<uint32_t>(rng_());
    }
    return std::format("{}-{:08x}", id_prefix(type), suffix);
}

ElementId IdGenerator::child_id(const ElementId& parent, size_t index) {
    return std::format("{}.{}", parent, index);
}

}  // namespace taskweave
