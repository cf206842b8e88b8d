#include "core/config/sandbox_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>
#include "protocol/execution_json.hpp"

namespace skillbox::core::config {

using errors::ErrorCategory;
using errors::SandboxError;
using logging::LogLevel;
using nlohmann::json;
namespace codes = errors::codes;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

errors::Result<std::string> required_string(const json& document, const char* key) {
    if (!document.contains(key)) {
        return SandboxError{ErrorCategory::Input,
                            std::string("Missing required field: ") + key,
                            codes::kConfigMissingField};
    }
    const auto& value = document.at(key);
    if (!value.is_string() || value.get<std::string>().empty()) {
        return SandboxError{ErrorCategory::Input,
                            std::string("Field '") + key + "' must be a non-empty string.",
                            codes::kConfigInvalidField};
    }
    return value.get<std::string>();
}

errors::Result<std::string> optional_string(const json& document, const char* key,
                                            const std::string& fallback) {
    if (!document.contains(key) || document.at(key).is_null()) {
        return fallback;
    }
    const auto& value = document.at(key);
    if (!value.is_string()) {
        return SandboxError{ErrorCategory::Input,
                            std::string("Field '") + key + "' must be a string.",
                            codes::kConfigInvalidField};
    }
    return value.get<std::string>();
}

}  // namespace

errors::Result<LogLevel> parse_log_level(const std::string& text) {
    const std::string level = lowercase(text);
    if (level == "debug") {
        return LogLevel::DEBUG;
    }
    if (level == "info") {
        return LogLevel::INFO;
    }
    if (level == "warn" || level == "warning") {
        return LogLevel::WARN;
    }
    if (level == "error") {
        return LogLevel::ERROR;
    }
    return SandboxError{ErrorCategory::Input, "Unknown log level: " + text,
                        codes::kInvalidLogLevel, "Use debug, info, warn or error."};
}

errors::Result<SandboxConfig> parse_config(const json& document,
                                           const std::filesystem::path& base_dir) {
    if (!document.is_object()) {
        return SandboxError{ErrorCategory::Input, "Sandbox manifest must be a JSON object.",
                            codes::kConfigParseError};
    }

    SandboxConfig config;

    auto name = required_string(document, "name");
    if (errors::is_error(name)) {
        return errors::get_error(name);
    }
    config.name = errors::get_value(name);

    auto root = required_string(document, "root");
    if (errors::is_error(root)) {
        return errors::get_error(root);
    }
    config.root = std::filesystem::path(errors::get_value(root));
    if (config.root.is_relative()) {
        config.root = base_dir / config.root;
    }

    auto scripts = optional_string(document, "scripts_dir", "scripts");
    if (errors::is_error(scripts)) {
        return errors::get_error(scripts);
    }
    config.scripts_subdir = std::filesystem::path(errors::get_value(scripts));

    auto allowed_tools = optional_string(document, "allowed_tools", "");
    if (errors::is_error(allowed_tools)) {
        return errors::get_error(allowed_tools);
    }
    config.allowed_tools = errors::get_value(allowed_tools);

    if (document.contains("constraints")) {
        auto constraints = protocol::constraints_from_json(document.at("constraints"));
        if (errors::is_error(constraints)) {
            return errors::get_error(constraints);
        }
        config.constraints = errors::get_value(constraints);
    }

    auto level_text = optional_string(document, "log_level", "info");
    if (errors::is_error(level_text)) {
        return errors::get_error(level_text);
    }
    auto level = parse_log_level(errors::get_value(level_text));
    if (errors::is_error(level)) {
        return errors::get_error(level);
    }
    config.log_level = errors::get_value(level);

    return config;
}

errors::Result<SandboxConfig> apply_env_overrides(SandboxConfig config) {
    if (const char* level_env = std::getenv(kLogLevelEnv); level_env != nullptr &&
                                                           level_env[0] != '\0') {
        auto level = parse_log_level(level_env);
        if (errors::is_error(level)) {
            return errors::get_error(level);
        }
        config.log_level = errors::get_value(level);
    }

    if (const char* timeout_env = std::getenv(kMaxExecutionTimeEnv);
        timeout_env != nullptr && timeout_env[0] != '\0') {
        const std::string text(timeout_env);
        std::uint32_t seconds = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, seconds);
        if (ec != std::errc() || ptr != end) {
            return SandboxError{ErrorCategory::Input,
                                std::string("Invalid number in ") + kMaxExecutionTimeEnv +
                                    ": " + text,
                                codes::kConfigInvalidField,
                                "Provide a non-negative number of seconds."};
        }
        config.constraints.max_execution_time_s = seconds;
    }

    return config;
}

errors::Result<SandboxConfig> load_config(const std::filesystem::path& manifest_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(manifest_path, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Sandbox manifest not found: " + manifest_path.string(),
                            codes::kConfigNotFound};
    }

    std::ifstream in(manifest_path);
    if (!in.is_open()) {
        return SandboxError{ErrorCategory::Input,
                            "Unable to open sandbox manifest: " + manifest_path.string(),
                            codes::kConfigNotFound};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return SandboxError{ErrorCategory::Input,
                            "Sandbox manifest is not valid JSON: " + manifest_path.string(),
                            codes::kConfigParseError};
    }

    const auto base_dir =
        std::filesystem::absolute(manifest_path, ec).parent_path();
    auto parsed = parse_config(document, ec ? manifest_path.parent_path() : base_dir);
    if (errors::is_error(parsed)) {
        return errors::get_error(parsed);
    }
    return apply_env_overrides(errors::get_value(parsed));
}

void apply_logging(const SandboxConfig& config) {
    logging::Logger::get().set_level(config.log_level);
}

}  // namespace skillbox::core::config
