/**
 * @file variables.hpp
 * @brief Variable binding values shared by playbooks and workflows.
 */

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace taskweave {

/// A bound variable: string, number or boolean.
using VariableValue = std::variant<std::string, double, bool>;

/// Ordered so that iteration (and therefore audit output) is deterministic.
using VariableMap = std::map<std::string, VariableValue, std::less<>>;

/**
 * @brief Render a value the way it is substituted into templates.
 *
 * Integral numbers print without a fractional part ("42", not "42.000000").
 */
std::string to_display_string(const VariableValue& value);

/**
 * @brief Truthiness used by step conditions.
 *
 * Strings are false when empty or one of "false", "0", "no", "off"
 * (case-insensitive); numbers are false when zero.
 */
bool is_truthy(const VariableValue& value);
bool is_truthy(std::string_view text);

}  // namespace taskweave
