#pragma once
#include <string>
#include <variant>

namespace skillbox::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed permission spec or missing script
        Policy,     // E.g., a path escapes the sandbox root
        Execution,  // E.g., a child process could not be started
        Internal    // E.g., pipe creation failed
    };

    // Stable error codes shared by callers and tests.
    namespace codes {
        inline constexpr const char* kGrammarError = "grammar_error";
        inline constexpr const char* kPathTraversal = "path_traversal";
        inline constexpr const char* kNotFound = "not_found";
        inline constexpr const char* kOutsideScriptsDir = "outside_scripts_dir";
        inline constexpr const char* kInvalidSandboxRoot = "invalid_sandbox_root";
        inline constexpr const char* kInvalidSandboxName = "invalid_sandbox_name";
        inline constexpr const char* kUnbalancedQuotes = "unbalanced_quotes";
        inline constexpr const char* kDanglingEscape = "dangling_escape";
        inline constexpr const char* kPipeCreationFailed = "pipe_creation_failed";
        inline constexpr const char* kForkFailed = "fork_failed";
        inline constexpr const char* kSpawnFailed = "spawn_failed";
        inline constexpr const char* kInvalidLogLevel = "invalid_log_level";
        inline constexpr const char* kConfigNotFound = "config_not_found";
        inline constexpr const char* kConfigParseError = "config_parse_error";
        inline constexpr const char* kConfigInvalidField = "config_invalid_field";
        inline constexpr const char* kConfigMissingField = "config_missing_field";
    }  // namespace codes

    // The standardized error payload
    struct SandboxError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a SandboxError.
    template <typename T>
    using Result = std::variant<T, SandboxError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<SandboxError>(result);
    }

    template <typename T>
    const SandboxError& get_error(const Result<T>& result) {
        return std::get<SandboxError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

} // namespace skillbox::core::errors
