#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/sandbox_errors.hpp"

namespace skillbox::policy {

// Tool name that grants command execution. Compared case-insensitively.
inline constexpr const char* kExecutableTool = "Bash";

// One grant, e.g. `Bash(python:*)` or the bare capability `Read`.
struct PermissionRule {
    std::string tool;
    std::optional<std::string> scope_command;
    bool wildcard_args = false;

    // scope_command split on whitespace; empty when there is no scope.
    std::vector<std::string> scope_words;

    bool grants_execution() const;
};

// Renders the rule back into grammar form.
std::string to_string(const PermissionRule& rule);

// Ordered, immutable list of rules. Evaluation order is declaration order.
class PermissionSet {
public:
    PermissionSet() = default;
    explicit PermissionSet(std::vector<PermissionRule> rules);

    const std::vector<PermissionRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }
    std::size_t size() const { return rules_.size(); }

    // True when a rule names `tool` (case-insensitive), scoped or not.
    bool has_capability(const std::string& tool) const;

    std::vector<std::string> tokens() const;

private:
    std::vector<PermissionRule> rules_;
};

class PermissionGrammar {
public:
    // Comma-separated tokens take priority; without any comma the spec is
    // split on whitespace outside parentheses.
    static core::errors::Result<PermissionSet> parse(const std::string& spec);

    static core::errors::Result<PermissionRule> parse_token(const std::string& token);

private:
    static std::vector<std::string> split_on_commas(const std::string& spec);
    static std::vector<std::string> split_on_whitespace(const std::string& spec);
};

}  // namespace skillbox::policy
