/**
 * @file dependency.cpp
 * @brief Dependency type parsing, gate evaluation and edge key hashing.
 */

#include "graph/dependency.hpp"

#include <algorithm>
#include <functional>

namespace taskweave {

std::optional<DependencyType> parse_dependency_type(std::string_view text) {
    for (auto type : kAllDependencyTypes) {
        if (to_string(type) == text) return type;
    }
    return std::nullopt;
}

bool Gate::is_satisfied(Timestamp now) const {
    switch (type) {
        case GateType::Timer:
            return wait_until.has_value() && now >= *wait_until;
        case GateType::Approval: {
            size_t needed = approval_count.value_or(required_approvers.size());
            size_t approved = std::count_if(
                current_approvers.begin(), current_approvers.end(),
                [&](const EntityId& who) {
                    return std::find(required_approvers.begin(), required_approvers.end(), who)
                           != required_approvers.end();
                });
            return approved >= needed;
        }
        case GateType::External:
        case GateType::Webhook:
            return satisfied;
    }
    return false;
}

size_t EdgeKeyHash::operator()(const EdgeKey& key) const noexcept {
    size_t h = std::hash<std::string>{}(key.source_id);
    h ^= std::hash<std::string>{}(key.target_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= static_cast<size_t>(key.type) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

std::string describe(const EdgeKey& key) {
    return key.source_id + " -> " + key.target_id + " (" + std::string{to_string(key.type)} + ")";
}

bool matches(DependencyType type, std::span<const DependencyType> types) {
    return types.empty() || std::find(types.begin(), types.end(), type) != types.end();
}

}  // namespace taskweave
