#include "session/execution_metrics.hpp"

#include "core/logging/logger.hpp"

namespace skillbox::session {

using protocol::ErrorKind;

void MetricsRecorder::record(const protocol::ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.total_executions;
    metrics_.total_execution_time_s += result.execution_time_s;

    if (result.success) {
        ++metrics_.successful_executions;
        return;
    }

    ++metrics_.failed_executions;
    if (!result.error_kind.has_value()) {
        return;
    }
    switch (result.error_kind.value()) {
        case ErrorKind::PermissionDenied:
            ++metrics_.permission_denials;
            break;
        case ErrorKind::Timeout:
            ++metrics_.timeouts;
            break;
        case ErrorKind::ExecutionError:
            break;
    }
}

ExecutionMetrics MetricsRecorder::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void MetricsRecorder::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_ = ExecutionMetrics{};
    }
    LOG_INFO("Execution metrics reset");
}

}  // namespace skillbox::session
