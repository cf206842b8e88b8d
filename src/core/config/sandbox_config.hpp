#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/sandbox_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/execution_contract.hpp"

namespace skillbox::core::config {

inline constexpr const char* kLogLevelEnv = "SKILLBOX_LOG_LEVEL";
inline constexpr const char* kMaxExecutionTimeEnv = "SKILLBOX_MAX_EXECUTION_TIME";

struct SandboxConfig {
    std::string name;
    std::filesystem::path root;
    std::filesystem::path scripts_subdir = "scripts";
    std::string allowed_tools;
    protocol::ExecutionConstraints constraints;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Accepts debug, info, warn/warning, error (any case).
errors::Result<logging::LogLevel> parse_log_level(const std::string& text);

// Builds a config from a manifest document. A relative root resolves against
// `base_dir`.
errors::Result<SandboxConfig> parse_config(const nlohmann::json& document,
                                           const std::filesystem::path& base_dir);

// Reads a JSON manifest from disk, then applies environment overrides.
errors::Result<SandboxConfig> load_config(const std::filesystem::path& manifest_path);

// SKILLBOX_LOG_LEVEL and SKILLBOX_MAX_EXECUTION_TIME, when set, win over the manifest.
errors::Result<SandboxConfig> apply_env_overrides(SandboxConfig config);

void apply_logging(const SandboxConfig& config);

}  // namespace skillbox::core::config
