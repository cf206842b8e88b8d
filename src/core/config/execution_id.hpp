#pragma once
#include <string>
#include <random>
#include <sstream>

namespace skillbox::core::config {

    // Generates a simple 8-character hex ID prefixed with "exec-"
    inline std::string generate_execution_id() {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "exec-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace skillbox::core::config
