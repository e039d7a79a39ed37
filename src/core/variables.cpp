/**
 * @file variables.cpp
 * @brief Variable value rendering and truthiness.
 */

#include "core/variables.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

namespace taskweave {

std::string to_display_string(const VariableValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";

    double number = std::get<double>(value);
    if (std::isfinite(number) && number == std::trunc(number)
        && std::fabs(number) < 1e15) {
        return std::format("{}", static_cast<long long>(number));
    }
    return std::format("{}", number);
}

bool is_truthy(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(lowered.empty() || lowered == "false" || lowered == "0"
             || lowered == "no" || lowered == "off");
}

bool is_truthy(const VariableValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* d = std::get_if<double>(&value)) return *d != 0.0;
    return is_truthy(std::string_view{std::get<std::string>(value)});
}

}  // namespace taskweave
