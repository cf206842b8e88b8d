#pragma once

#include <cstdint>
#include <mutex>
#include "protocol/execution_contract.hpp"

namespace skillbox::session {

struct ExecutionMetrics {
    std::uint64_t total_executions = 0;
    std::uint64_t successful_executions = 0;
    std::uint64_t failed_executions = 0;
    std::uint64_t permission_denials = 0;
    std::uint64_t timeouts = 0;
    double total_execution_time_s = 0.0;

    double average_execution_time_s() const {
        if (total_executions == 0) {
            return 0.0;
        }
        return total_execution_time_s / static_cast<double>(total_executions);
    }
};

// Caller-owned aggregate of execution results. Safe to share between threads.
class MetricsRecorder {
public:
    void record(const protocol::ExecutionResult& result);
    ExecutionMetrics snapshot() const;
    void reset();

private:
    mutable std::mutex mutex_;
    ExecutionMetrics metrics_;
};

}  // namespace skillbox::session
