#include "session/skill_sandbox.hpp"

#include <sstream>
#include <utility>
#include "core/config/sandbox_config.hpp"
#include "core/logging/logger.hpp"
#include "policy/path_resolver.hpp"

namespace skillbox::session {

using core::errors::ErrorCategory;
using core::errors::SandboxError;
using policy::PathResolver;
using policy::PermissionGrammar;
using protocol::EnvOverrides;
using protocol::ExecutionConstraints;
using protocol::ExecutionResult;
namespace codes = core::errors::codes;

namespace {

std::string join(const std::vector<std::string>& values) {
    std::ostringstream out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ",";
        }
        out << values[i];
    }
    return out.str();
}

}  // namespace

SkillSandbox::SkillSandbox(runtime::ExecutionEngine engine,
                           std::filesystem::path scripts_subdir,
                           ExecutionConstraints default_constraints)
    : engine_(std::move(engine)),
      scripts_subdir_(std::move(scripts_subdir)),
      default_constraints_(std::move(default_constraints)) {}

core::errors::Result<SkillSandbox> SkillSandbox::create(
    const std::string& name, const std::filesystem::path& root,
    const std::string& permission_spec, ExecutionConstraints default_constraints,
    const std::filesystem::path& scripts_subdir) {
    if (name.empty()) {
        return SandboxError{ErrorCategory::Input, "Sandbox name cannot be empty.",
                            codes::kInvalidSandboxName};
    }

    auto parsed = PermissionGrammar::parse(permission_spec);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        LOG_ERROR("Sandbox '" + name + "' rejected [" + err.code + "]: " + err.message);
        return err;
    }

    auto canonical_root = PathResolver::canonicalize_root(root);
    if (core::errors::is_error(canonical_root)) {
        const auto& err = core::errors::get_error(canonical_root);
        LOG_ERROR("Sandbox '" + name + "' rejected [" + err.code + "]: " + err.message);
        return err;
    }
    const auto& root_path = core::errors::get_value(canonical_root);

    const std::filesystem::path scripts_dir =
        (root_path / scripts_subdir).lexically_normal();
    if (scripts_subdir.empty() || scripts_subdir.is_absolute() ||
        !PathResolver::is_within_root(root_path, scripts_dir)) {
        return SandboxError{ErrorCategory::Input,
                            "Scripts directory must be a relative path inside the "
                            "sandbox root: " + scripts_subdir.string(),
                            codes::kInvalidSandboxRoot};
    }

    runtime::SandboxIdentity identity{name, root_path, scripts_dir};
    const auto& rules = core::errors::get_value(parsed);
    LOG_INFO("Sandbox '" + name + "' initialized: root=" + root_path.string() +
             " rules=[" + join(rules.tokens()) + "] max_execution_time=" +
             std::to_string(default_constraints.max_execution_time_s) + "s");
    if (rules.empty()) {
        LOG_WARN("Sandbox '" + name + "' has no permission rules; every command will be denied.");
    }

    return SkillSandbox(runtime::ExecutionEngine(rules, std::move(identity)),
                        scripts_subdir, std::move(default_constraints));
}

core::errors::Result<SkillSandbox> SkillSandbox::from_config(
    const core::config::SandboxConfig& config) {
    return create(config.name, config.root, config.allowed_tools, config.constraints,
                  config.scripts_subdir);
}

core::errors::Result<std::filesystem::path> SkillSandbox::resolve_script(
    const std::filesystem::path& requested_path) const {
    auto resolved = PathResolver::resolve(root(), scripts_subdir_, requested_path);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        LOG_WARN("[" + name() + "] Script path rejected [" + err.code + "]: " +
                 err.message);
    }
    return resolved;
}

bool SkillSandbox::is_allowed(const std::string& command) const {
    return engine_.is_allowed(command);
}

ExecutionResult SkillSandbox::execute(const std::string& command,
                                      const EnvOverrides& env) const {
    return engine_.execute(command, default_constraints_, env);
}

ExecutionResult SkillSandbox::execute(const std::string& command,
                                      const ExecutionConstraints& constraints,
                                      const EnvOverrides& env) const {
    return engine_.execute(command, constraints, env);
}

}  // namespace skillbox::session
