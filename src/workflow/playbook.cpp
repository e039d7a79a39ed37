/**
 * @file playbook.cpp
 * @brief Playbook inheritance, validation and variable resolution.
 */

#include "workflow/playbook.hpp"

#include "graph/cycle_detector.hpp"
#include "graph/dependency.hpp"
#include "workflow/template_eval.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_set>

namespace taskweave {

namespace {

template <typename T, typename Key>
void merge_by_key(std::vector<T>& base, const std::vector<T>& overrides, Key key) {
    for (const auto& item : overrides) {
        auto it = std::find_if(base.begin(), base.end(),
                               [&](const T& existing) { return key(existing) == key(item); });
        if (it != base.end()) {
            *it = item;
        } else {
            base.push_back(item);
        }
    }
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

std::optional<double> parse_number(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (iequals(text, "true")) return true;
    if (iequals(text, "false")) return false;
    return std::nullopt;
}

Result<VariableValue> coerce(const VariableDef& def, const VariableValue& value) {
    auto mismatch = [&] {
        return Error{ErrorCode::ValidationError,
                     "Variable '" + def.name + "' expects a " + std::string{to_string(def.type)}
                         + ", got '" + to_display_string(value) + "'"};
    };

    switch (def.type) {
        case VariableType::String:
            return VariableValue{to_display_string(value)};
        case VariableType::Number:
            if (std::holds_alternative<double>(value)) return value;
            if (const auto* text = std::get_if<std::string>(&value)) {
                if (auto number = parse_number(*text)) return VariableValue{*number};
            }
            return mismatch();
        case VariableType::Boolean:
            if (std::holds_alternative<bool>(value)) return value;
            if (const auto* text = std::get_if<std::string>(&value)) {
                if (auto flag = parse_bool(*text)) return VariableValue{*flag};
            }
            return mismatch();
    }
    return mismatch();
}

}  // namespace

// ─────────────────────────────────────────────
// Inheritance
// ─────────────────────────────────────────────

Result<Playbook> resolve_inheritance(const Playbook& playbook, const PlaybookLoader& loader,
                                     size_t max_depth) {
    // chain[0] is the playbook itself, chain.back() the root ancestor
    std::vector<Playbook> chain{playbook};
    std::unordered_set<std::string> seen{playbook.name};

    while (chain.back().extends) {
        const std::string parent_name = *chain.back().extends;
        if (chain.size() > max_depth) {
            return Error{ErrorCode::ValidationError,
                         "Playbook inheritance chain of '" + playbook.name + "' exceeds "
                             + std::to_string(max_depth) + " levels"};
        }
        if (seen.contains(parent_name)) {
            return Error{ErrorCode::ValidationError,
                         "Circular playbook inheritance through '" + parent_name + "'"};
        }

        std::optional<Playbook> parent = loader ? loader(parent_name) : std::nullopt;
        if (!parent) {
            return Error{ErrorCode::NotFound, "Parent playbook not found: " + parent_name};
        }
        seen.insert(parent_name);
        chain.push_back(std::move(*parent));
    }

    Playbook resolved = chain.back();
    for (auto it = std::next(chain.rbegin()); it != chain.rend(); ++it) {
        merge_by_key(resolved.steps, it->steps, [](const PlaybookStep& s) { return s.id; });
        merge_by_key(resolved.variables, it->variables, [](const VariableDef& v) { return v.name; });
    }
    resolved.id = playbook.id;
    resolved.name = playbook.name;
    resolved.title = playbook.title;
    resolved.extends.reset();
    return resolved;
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> validate_playbook(const Playbook& playbook) {
    std::unordered_set<std::string> step_ids;
    for (const auto& step : playbook.steps) {
        if (step.id.empty()) {
            return Error{ErrorCode::ValidationError, "Playbook step has an empty id"};
        }
        if (!step_ids.insert(step.id).second) {
            return Error{ErrorCode::ValidationError, "Duplicate step id: " + step.id};
        }
        if (step.priority && (*step.priority < 1 || *step.priority > 5)) {
            return Error{ErrorCode::ValidationError,
                         "Step '" + step.id + "' priority must be between 1 and 5"};
        }
    }

    // Step ordering expressed as blocks edges: prerequisite -> dependent.
    std::vector<Dependency> ordering;
    for (const auto& step : playbook.steps) {
        for (const auto& prerequisite : step.depends_on) {
            if (!step_ids.contains(prerequisite)) {
                return Error{ErrorCode::ValidationError,
                             "Step '" + step.id + "' depends on unknown step '" + prerequisite + "'"};
            }
            Dependency edge;
            edge.source_id = prerequisite;
            edge.target_id = step.id;
            edge.type = DependencyType::Blocks;
            ordering.push_back(std::move(edge));
        }
    }
    if (auto cycle = find_cycle_path(ordering, Family::Scheduling)) {
        std::string path;
        for (const auto& id : *cycle) {
            if (!path.empty()) path += " -> ";
            path += id;
        }
        return Error{ErrorCode::ValidationError, "Circular step dependencies: " + path};
    }

    std::unordered_set<std::string> names;
    for (const auto& def : playbook.variables) {
        if (!is_valid_variable_name(def.name)) {
            return Error{ErrorCode::ValidationError, "Invalid variable name: '" + def.name + "'"};
        }
        if (!names.insert(def.name).second) {
            return Error{ErrorCode::ValidationError, "Duplicate variable: " + def.name};
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// Variable Resolution
// ─────────────────────────────────────────────

Result<VariableMap> resolve_variables(const std::vector<VariableDef>& defs,
                                      const VariableMap& provided) {
    VariableMap resolved = provided;

    for (const auto& def : defs) {
        std::optional<VariableValue> raw;
        if (auto it = provided.find(def.name); it != provided.end()) {
            raw = it->second;
        } else if (def.default_value) {
            raw = def.default_value;
        } else if (def.required) {
            return Error{ErrorCode::ValidationError, "Missing required variable: " + def.name};
        } else {
            continue;
        }

        auto value = coerce(def, *raw);
        if (!value) return value.error();

        if (!def.enum_values.empty()) {
            auto shown = to_display_string(*value);
            bool allowed = std::any_of(def.enum_values.begin(), def.enum_values.end(),
                                       [&](const VariableValue& option) {
                                           return to_display_string(option) == shown;
                                       });
            if (!allowed) {
                return Error{ErrorCode::ValidationError,
                             "Variable '" + def.name + "' value '" + shown
                                 + "' is not one of the allowed values"};
            }
        }
        resolved.insert_or_assign(def.name, std::move(*value));
    }
    return resolved;
}

}  // namespace taskweave
