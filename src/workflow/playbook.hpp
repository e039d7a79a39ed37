/**
 * @file playbook.hpp
 * @brief Playbook templates: steps, typed variable declarations, inheritance.
 *
 * A Playbook is an immutable value supplied by a loader; file discovery
 * and parsing happen elsewhere. This header covers the checks that run on
 * a playbook before it is poured.
 */

#pragma once

#include "core/result.hpp"
#include "core/variables.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

// ─────────────────────────────────────────────
// Variable Declarations
// ─────────────────────────────────────────────

enum class VariableType : uint8_t {
    String,
    Number,
    Boolean
};

[[nodiscard]] constexpr std::string_view to_string(VariableType type) noexcept {
    switch (type) {
        case VariableType::String:  return "string";
        case VariableType::Number:  return "number";
        case VariableType::Boolean: return "boolean";
    }
    return "unknown";
}

struct VariableDef {
    std::string name;
    VariableType type = VariableType::String;
    bool required = false;
    std::optional<VariableValue> default_value;
    std::vector<VariableValue> enum_values;     ///< Empty means unrestricted
    std::string description;
};

// ─────────────────────────────────────────────
// Steps & Playbooks
// ─────────────────────────────────────────────

struct PlaybookStep {
    std::string id;
    std::string title;                          ///< May contain {{placeholders}}
    std::string description;
    std::optional<std::string> assignee;
    std::optional<int> priority;
    std::optional<std::string> task_type;
    std::vector<std::string> tags;
    std::vector<std::string> depends_on;        ///< Step ids; become blocks edges
    std::string condition;                      ///< Empty means always included
};

struct Playbook {
    std::string id;
    std::string name;                           ///< Key used by `extends`
    std::string title;
    std::vector<PlaybookStep> steps;
    std::vector<VariableDef> variables;
    std::optional<std::string> extends;
};

/// Looks a playbook up by name; nullopt when unknown.
using PlaybookLoader = std::function<std::optional<Playbook>(const std::string&)>;

/**
 * @brief Flatten an `extends` chain into one playbook.
 *
 * Parent steps come first; a child step with the same id replaces the
 * parent's in place. Variable declarations merge the same way. An unknown
 * parent is NotFound; a circular chain or one longer than `max_depth` is a
 * ValidationError.
 */
Result<Playbook> resolve_inheritance(const Playbook& playbook, const PlaybookLoader& loader,
                                     size_t max_depth);

/**
 * @brief Structural checks on a (resolved) playbook.
 *
 * Step ids must be non-empty and unique, depends_on must name existing
 * steps, and the step ordering must be acyclic. Variable names must be
 * valid and unique.
 */
Result<void> validate_playbook(const Playbook& playbook);

/**
 * @brief Bind provided values to the declarations.
 *
 * Values are type-checked (strings that parse as the declared number or
 * boolean type are coerced) and enum-checked; defaults fill gaps; a
 * missing required variable is a ValidationError. Provided values with no
 * declaration pass through unchanged.
 */
Result<VariableMap> resolve_variables(const std::vector<VariableDef>& defs,
                                      const VariableMap& provided);

}  // namespace taskweave
