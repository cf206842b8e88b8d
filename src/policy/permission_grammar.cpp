#include "policy/permission_grammar.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace skillbox::policy {

using core::errors::ErrorCategory;
using core::errors::SandboxError;
namespace codes = core::errors::codes;

namespace {

constexpr const char* kWildcardSuffix = ":*";

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(begin, end - begin);
}

bool iequals(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](const unsigned char a, const unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

bool is_quote(const char c) {
    return c == '"' || c == '\'';
}

std::string strip_quotes(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_quote(value[begin])) {
        ++begin;
    }
    while (end > begin && is_quote(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string normalize_token(const std::string& raw) {
    return trim(strip_quotes(trim(raw)));
}

bool is_tool_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](const unsigned char c) {
        return std::isalnum(c) != 0 || c == '_';
    });
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_words(const std::string& value) {
    std::istringstream in(value);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

SandboxError grammar_error(const std::string& token, const std::string& reason) {
    return SandboxError{ErrorCategory::Input,
                        "Malformed permission token '" + token + "': " + reason,
                        codes::kGrammarError,
                        "Use Tool or Tool(scope), e.g. Bash(python:*),Read"};
}

}  // namespace

bool PermissionRule::grants_execution() const {
    return iequals(tool, kExecutableTool);
}

std::string to_string(const PermissionRule& rule) {
    if (!rule.scope_command.has_value()) {
        return rule.tool;
    }
    return rule.tool + "(" + rule.scope_command.value() +
           (rule.wildcard_args ? kWildcardSuffix : "") + ")";
}

PermissionSet::PermissionSet(std::vector<PermissionRule> rules)
    : rules_(std::move(rules)) {}

bool PermissionSet::has_capability(const std::string& tool) const {
    return std::any_of(rules_.begin(), rules_.end(),
                       [&tool](const PermissionRule& rule) {
                           return iequals(rule.tool, tool);
                       });
}

std::vector<std::string> PermissionSet::tokens() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& rule : rules_) {
        out.push_back(to_string(rule));
    }
    return out;
}

std::vector<std::string> PermissionGrammar::split_on_commas(const std::string& spec) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (true) {
        const auto comma = spec.find(',', start);
        tokens.push_back(spec.substr(start, comma == std::string::npos
                                                ? std::string::npos
                                                : comma - start));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return tokens;
}

// Whitespace inside parentheses belongs to the token, so `Bash(git status:*) Read`
// yields two tokens.
std::vector<std::string> PermissionGrammar::split_on_whitespace(const std::string& spec) {
    std::vector<std::string> tokens;
    std::string current;
    int depth = 0;
    for (const char c : spec) {
        if (c == '(') {
            ++depth;
        } else if (c == ')' && depth > 0) {
            --depth;
        }

        if (depth == 0 && std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

core::errors::Result<PermissionRule> PermissionGrammar::parse_token(
    const std::string& token) {
    const std::string text = normalize_token(token);
    if (text.empty()) {
        return grammar_error(token, "empty token");
    }

    const auto open = text.find('(');
    const auto close = text.find(')');

    PermissionRule rule;
    if (open == std::string::npos) {
        if (close != std::string::npos) {
            return grammar_error(text, "unbalanced parentheses");
        }
        if (!is_tool_name(text)) {
            return grammar_error(text, "invalid tool name");
        }
        rule.tool = text;
        return rule;
    }

    rule.tool = trim(text.substr(0, open));
    if (rule.tool.empty()) {
        return grammar_error(text, "empty tool name");
    }
    if (!is_tool_name(rule.tool)) {
        return grammar_error(text, "invalid tool name");
    }
    if (close == std::string::npos || close != text.size() - 1 ||
        text.find('(', open + 1) != std::string::npos) {
        return grammar_error(text, "unbalanced parentheses");
    }

    std::string inner = trim(text.substr(open + 1, close - open - 1));
    if (inner.empty()) {
        return grammar_error(text, "empty scope");
    }

    if (!rule.grants_execution()) {
        rule.scope_command = inner;
        return rule;
    }

    if (ends_with(inner, kWildcardSuffix)) {
        rule.wildcard_args = true;
        inner = trim(inner.substr(0, inner.size() - 2));
        if (inner.empty()) {
            return grammar_error(text, "wildcard scope has no command");
        }
    }
    rule.scope_words = split_words(inner);
    rule.scope_command = inner;
    return rule;
}

core::errors::Result<PermissionSet> PermissionGrammar::parse(const std::string& spec) {
    const std::string text = normalize_token(spec);
    if (text.empty()) {
        return PermissionSet{};
    }

    const std::vector<std::string> raw_tokens = text.find(',') != std::string::npos
                                                    ? split_on_commas(text)
                                                    : split_on_whitespace(text);

    std::vector<PermissionRule> rules;
    rules.reserve(raw_tokens.size());
    for (const auto& raw : raw_tokens) {
        if (normalize_token(raw).empty()) {
            continue;
        }
        auto parsed = parse_token(raw);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        rules.push_back(core::errors::get_value(parsed));
    }
    return PermissionSet(std::move(rules));
}

}  // namespace skillbox::policy
