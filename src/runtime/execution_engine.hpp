#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "policy/permission_grammar.hpp"
#include "protocol/execution_contract.hpp"

namespace skillbox::runtime {

// Injected into every child; caller overrides never replace these.
inline constexpr const char* kSandboxNameEnv = "SKILL_NAME";
inline constexpr const char* kSandboxRootEnv = "SKILL_DIR";
inline constexpr const char* kScriptsDirEnv = "SCRIPTS_DIR";

struct SandboxIdentity {
    std::string name;
    std::filesystem::path root;         // canonical
    std::filesystem::path scripts_dir;  // canonical root / scripts subdir
};

class ExecutionEngine {
public:
    ExecutionEngine(policy::PermissionSet rules, SandboxIdentity identity);

    // Pure and deterministic: no logging, no process, no filesystem access.
    static bool is_allowed(const policy::PermissionSet& rules,
                           const std::string& command);
    bool is_allowed(const std::string& command) const;

    // Never throws. Every failure is reported inside the returned result.
    protocol::ExecutionResult execute(const std::string& command,
                                      const protocol::ExecutionConstraints& constraints,
                                      const protocol::EnvOverrides& env = {}) const;

    const policy::PermissionSet& rules() const { return rules_; }
    const SandboxIdentity& identity() const { return identity_; }

    // Ambient environment, then `overrides`, then the three sandbox keys.
    std::vector<std::string> build_environment(
        const protocol::EnvOverrides& overrides) const;

private:
    static bool rule_matches(const policy::PermissionRule& rule,
                             const std::vector<std::string>& words);

    std::filesystem::path resolve_working_directory(
        const protocol::ExecutionConstraints& constraints) const;

    policy::PermissionSet rules_;
    SandboxIdentity identity_;
};

}  // namespace skillbox::runtime
