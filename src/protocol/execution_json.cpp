#include "protocol/execution_json.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace skillbox::protocol {

using core::errors::ErrorCategory;
using core::errors::SandboxError;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

SandboxError invalid_field(const std::string& field, const std::string& expected) {
    return SandboxError{ErrorCategory::Input,
                        "Constraint '" + field + "' must be " + expected + ".",
                        codes::kConfigInvalidField};
}

}  // namespace

json to_json(const ExecutionResult& result) {
    json payload;
    payload["success"] = result.success;
    payload["exit_code"] = result.exit_code;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["execution_time"] = result.execution_time_s;
    payload["command"] = result.command;
    payload["error_kind"] = result.error_kind.has_value()
                                ? json(to_string(result.error_kind.value()))
                                : json(nullptr);
    payload["error_message"] = result.error_message.has_value()
                                   ? json(result.error_message.value())
                                   : json(nullptr);
    return payload;
}

json to_json(const ExecutionConstraints& constraints) {
    json payload;
    payload["max_execution_time"] = constraints.max_execution_time_s;
    payload["max_memory"] = constraints.max_memory_mb.has_value()
                                ? json(constraints.max_memory_mb.value())
                                : json(nullptr);
    payload["network_access"] = constraints.network_access;
    payload["working_directory"] = constraints.working_directory.has_value()
                                       ? json(constraints.working_directory->string())
                                       : json(nullptr);
    return payload;
}

core::errors::Result<ExecutionConstraints> constraints_from_json(const json& payload) {
    if (!payload.is_object()) {
        return SandboxError{ErrorCategory::Input, "Constraints must be a JSON object.",
                            codes::kConfigInvalidField};
    }

    ExecutionConstraints constraints;

    if (payload.contains("max_execution_time")) {
        const auto& value = payload.at("max_execution_time");
        if (!value.is_number_unsigned() ||
            value.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            return invalid_field("max_execution_time", "a non-negative number of seconds");
        }
        constraints.max_execution_time_s = value.get<std::uint32_t>();
    }

    if (payload.contains("max_memory")) {
        const auto& value = payload.at("max_memory");
        if (!value.is_null()) {
            if (!value.is_number_unsigned()) {
                return invalid_field("max_memory", "a non-negative number of megabytes");
            }
            constraints.max_memory_mb = value.get<std::uint64_t>();
        }
    }

    if (payload.contains("network_access")) {
        const auto& value = payload.at("network_access");
        if (!value.is_boolean()) {
            return invalid_field("network_access", "a boolean");
        }
        constraints.network_access = value.get<bool>();
    }

    if (payload.contains("working_directory")) {
        const auto& value = payload.at("working_directory");
        if (!value.is_null()) {
            if (!value.is_string() || value.get<std::string>().empty()) {
                return invalid_field("working_directory", "a non-empty path string");
            }
            constraints.working_directory = std::filesystem::path(value.get<std::string>());
        }
    }

    return constraints;
}

}  // namespace skillbox::protocol
