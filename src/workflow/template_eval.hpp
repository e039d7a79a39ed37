/**
 * @file template_eval.hpp
 * @brief Pure placeholder substitution and step-condition evaluation.
 *
 * No side effects and no dependency on tasks or the graph, so the pour
 * engine's text handling is testable on its own.
 *
 * Condition grammar:
 * @code
 *   condition   := conjunction ( "||" conjunction )*
 *   conjunction := term ( "&&" term )*
 *   term        := [ "!" ] operand [ ( "==" | "!=" ) operand ]
 *   operand     := "{{" name "}}" | quoted literal | bare literal
 * @endcode
 * An operand standing alone is tested for truthiness (see is_truthy).
 * The empty condition is true.
 */

#pragma once

#include "core/result.hpp"
#include "core/variables.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

/// Valid placeholder names: a letter or '_' followed by letters, digits, '_', '.', '-'.
[[nodiscard]] bool is_valid_variable_name(std::string_view name) noexcept;

/**
 * @brief Replace every {{name}} with its bound value.
 *
 * Unbound names become the empty string. An unterminated "{{" or an
 * invalid name is a ValidationError.
 */
Result<std::string> substitute(std::string_view text, const VariableMap& vars);

/// Names referenced by {{...}} placeholders, in order of appearance.
Result<std::vector<std::string>> referenced_variables(std::string_view text);

/// Evaluate a step condition against the bindings.
Result<bool> evaluate_condition(std::string_view expression, const VariableMap& vars);

}  // namespace taskweave
