#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace skillbox::protocol {

enum class ErrorKind {
    PermissionDenied,
    Timeout,
    ExecutionError
};

// Caller-supplied environment entries merged over the ambient environment.
using EnvOverrides = std::map<std::string, std::string>;

struct ExecutionConstraints {
    std::uint32_t max_execution_time_s = 300;   // 0 disables the timer
    std::optional<std::uint64_t> max_memory_mb;  // best effort
    bool network_access = false;                 // advisory only
    std::optional<std::filesystem::path> working_directory;
};

// success == (!error_kind && exit_code == 0)
struct ExecutionResult {
    bool success = false;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double execution_time_s = 0.0;
    std::string command;
    std::optional<ErrorKind> error_kind;
    std::optional<std::string> error_message;
};

inline std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied:
            return "permission_denied";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::ExecutionError:
            return "execution_error";
        default:
            return "unknown";
    }
}

}  // namespace skillbox::protocol
