#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace skillbox::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every sandbox in the process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Optional tag printed on every line, e.g. the host's session id.
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) skillbox::core::logging::Logger::get().log(skillbox::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  skillbox::core::logging::Logger::get().log(skillbox::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  skillbox::core::logging::Logger::get().log(skillbox::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) skillbox::core::logging::Logger::get().log(skillbox::core::logging::LogLevel::ERROR, msg)

} // namespace skillbox::core::logging
