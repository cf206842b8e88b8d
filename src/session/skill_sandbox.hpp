#pragma once

#include <filesystem>
#include <string>
#include "core/errors/sandbox_errors.hpp"
#include "policy/permission_grammar.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/execution_engine.hpp"

namespace skillbox::core::config {
struct SandboxConfig;
}

namespace skillbox::session {

// A sandbox for one unit of work (a skill). Its root, scripts directory and
// permission rules are fixed at construction, so one instance can serve
// concurrent calls without locking.
class SkillSandbox {
public:
    // Fails with grammar_error on a malformed permission spec and with
    // invalid_sandbox_root when `root` is not an existing directory.
    static core::errors::Result<SkillSandbox> create(
        const std::string& name, const std::filesystem::path& root,
        const std::string& permission_spec,
        protocol::ExecutionConstraints default_constraints = {},
        const std::filesystem::path& scripts_subdir = "scripts");

    static core::errors::Result<SkillSandbox> from_config(
        const core::config::SandboxConfig& config);

    const std::string& name() const { return engine_.identity().name; }
    const std::filesystem::path& root() const { return engine_.identity().root; }
    const std::filesystem::path& scripts_dir() const {
        return engine_.identity().scripts_dir;
    }
    const std::filesystem::path& scripts_subdir() const { return scripts_subdir_; }
    const policy::PermissionSet& permissions() const { return engine_.rules(); }
    const protocol::ExecutionConstraints& default_constraints() const {
        return default_constraints_;
    }

    core::errors::Result<std::filesystem::path> resolve_script(
        const std::filesystem::path& requested_path) const;

    bool is_allowed(const std::string& command) const;

    protocol::ExecutionResult execute(const std::string& command,
                                      const protocol::EnvOverrides& env = {}) const;

    protocol::ExecutionResult execute(const std::string& command,
                                      const protocol::ExecutionConstraints& constraints,
                                      const protocol::EnvOverrides& env = {}) const;

private:
    SkillSandbox(runtime::ExecutionEngine engine, std::filesystem::path scripts_subdir,
                 protocol::ExecutionConstraints default_constraints);

    runtime::ExecutionEngine engine_;
    std::filesystem::path scripts_subdir_;
    protocol::ExecutionConstraints default_constraints_;
};

}  // namespace skillbox::session
