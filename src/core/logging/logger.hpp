#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace stepgate::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Writes to stderr so it never interleaves with the wrapped command's stdout.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_step(const std::string& step) {
            std::lock_guard<std::mutex> lock(mutex_);
            step_ = step;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (step_.empty() ? "" : "[" + step_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string step_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
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
    #define LOG_DEBUG(msg) stepgate::core::logging::Logger::get().log(stepgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  stepgate::core::logging::Logger::get().log(stepgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  stepgate::core::logging::Logger::get().log(stepgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) stepgate::core::logging::Logger::get().log(stepgate::core::logging::LogLevel::ERROR, msg)

} // namespace stepgate::core::logging
