#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/sandbox_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace skillbox::protocol {

nlohmann::json to_json(const ExecutionResult& result);

nlohmann::json to_json(const ExecutionConstraints& constraints);

// Missing keys keep their defaults. Wrong types fail with config_invalid_field.
core::errors::Result<ExecutionConstraints> constraints_from_json(
    const nlohmann::json& payload);

}  // namespace skillbox::protocol
