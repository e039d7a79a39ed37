/**
 * @file template_eval.cpp
 * @brief Template evaluator implementation.
 */

#include "workflow/template_eval.hpp"

#include <cctype>

namespace taskweave {

namespace {

constexpr std::string_view kOpen = "{{";
constexpr std::string_view kClose = "}}";

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * @brief Walks a template calling `on_text` for literal runs and
 *        `on_name` for each placeholder.
 */
template <typename OnText, typename OnName>
Result<void> scan_placeholders(std::string_view text, OnText&& on_text, OnName&& on_name) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(kOpen, pos);
        if (open == std::string_view::npos) {
            on_text(text.substr(pos));
            break;
        }
        on_text(text.substr(pos, open - pos));

        size_t close = text.find(kClose, open + kOpen.size());
        if (close == std::string_view::npos) {
            return Error{ErrorCode::ValidationError,
                         "Unterminated variable reference in: " + std::string{text}};
        }

        auto name = trim(text.substr(open + kOpen.size(), close - open - kOpen.size()));
        if (!is_valid_variable_name(name)) {
            return Error{ErrorCode::ValidationError,
                         "Malformed variable reference: "
                             + std::string{text.substr(open, close + kClose.size() - open)}};
        }
        on_name(name);
        pos = close + kClose.size();
    }
    return {};
}

// ─────────────────────────────────────────────
// Condition parser
// ─────────────────────────────────────────────

/**
 * @brief Recursive-descent evaluator over a condition string.
 */
class ConditionParser {
public:
    ConditionParser(std::string_view input, const VariableMap& vars)
        : input_(input), vars_(vars) {}

    Result<bool> parse() {
        auto value = disjunction();
        if (!value) return value;
        skip_space();
        if (pos_ != input_.size()) {
            return fail("Unexpected input at position " + std::to_string(pos_));
        }
        return value;
    }

private:
    Result<bool> disjunction() {
        auto left = conjunction();
        if (!left) return left;
        bool value = *left;
        while (consume("||")) {
            auto right = conjunction();
            if (!right) return right;
            value = value || *right;
        }
        return value;
    }

    Result<bool> conjunction() {
        auto left = term();
        if (!left) return left;
        bool value = *left;
        while (consume("&&")) {
            auto right = term();
            if (!right) return right;
            value = value && *right;
        }
        return value;
    }

    Result<bool> term() {
        skip_space();
        bool negate = false;
        // "!" but not the start of "!="
        if (peek("!") && !peek("!=")) {
            ++pos_;
            negate = true;
        }

        auto left = operand();
        if (!left) return left.error();

        bool value;
        if (consume("==")) {
            auto right = operand();
            if (!right) return right.error();
            value = *left == *right;
        } else if (consume("!=")) {
            auto right = operand();
            if (!right) return right.error();
            value = *left != *right;
        } else {
            value = is_truthy(std::string_view{*left});
        }
        return negate ? !value : value;
    }

    Result<std::string> operand() {
        skip_space();
        if (pos_ >= input_.size()) return fail("Missing operand");

        if (peek(kOpen)) {
            size_t close = input_.find(kClose, pos_ + kOpen.size());
            if (close == std::string_view::npos) return fail("Unterminated variable reference");
            auto name = trim(input_.substr(pos_ + kOpen.size(), close - pos_ - kOpen.size()));
            if (!is_valid_variable_name(name)) {
                return fail("Malformed variable reference: " + std::string{name});
            }
            pos_ = close + kClose.size();
            auto it = vars_.find(name);
            return it == vars_.end() ? std::string{} : to_display_string(it->second);
        }

        char quote = input_[pos_];
        if (quote == '"' || quote == '\'') {
            size_t end = input_.find(quote, pos_ + 1);
            if (end == std::string_view::npos) return fail("Unterminated string literal");
            std::string literal{input_.substr(pos_ + 1, end - pos_ - 1)};
            pos_ = end + 1;
            return literal;
        }

        size_t start = pos_;
        while (pos_ < input_.size() && !std::isspace(static_cast<unsigned char>(input_[pos_]))
               && !at_operator()) {
            ++pos_;
        }
        if (pos_ == start) return fail("Missing operand");
        return std::string{input_.substr(start, pos_ - start)};
    }

    bool at_operator() const {
        return peek("==") || peek("!=") || peek("&&") || peek("||");
    }

    bool peek(std::string_view token) const {
        return input_.substr(pos_).starts_with(token);
    }

    bool consume(std::string_view token) {
        skip_space();
        if (!peek(token)) return false;
        pos_ += token.size();
        return true;
    }

    void skip_space() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            ++pos_;
        }
    }

    Error fail(std::string message) const {
        return Error{ErrorCode::ValidationError,
                     "Invalid condition '" + std::string{input_} + "': " + std::move(message)};
    }

    std::string_view input_;
    const VariableMap& vars_;
    size_t pos_ = 0;
};

}  // namespace

bool is_valid_variable_name(std::string_view name) noexcept {
    if (name.empty()) return false;
    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : name.substr(1)) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.' && c != '-') return false;
    }
    return true;
}

Result<std::string> substitute(std::string_view text, const VariableMap& vars) {
    std::string out;
    out.reserve(text.size());

    auto scanned = scan_placeholders(
        text,
        [&](std::string_view literal) { out.append(literal); },
        [&](std::string_view name) {
            if (auto it = vars.find(name); it != vars.end()) {
                out += to_display_string(it->second);
            }
        });
    if (!scanned) return scanned.error();
    return out;
}

Result<std::vector<std::string>> referenced_variables(std::string_view text) {
    std::vector<std::string> names;
    auto scanned = scan_placeholders(
        text,
        [](std::string_view) {},
        [&](std::string_view name) { names.emplace_back(name); });
    if (!scanned) return scanned.error();
    return names;
}

Result<bool> evaluate_condition(std::string_view expression, const VariableMap& vars) {
    if (trim(expression).empty()) return true;
    return ConditionParser(expression, vars).parse();
}

}  // namespace taskweave
