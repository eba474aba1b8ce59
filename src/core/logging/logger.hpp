#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace tryrun::core::logging {

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
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Lines go to stderr; stdout is reserved for plan/attempt output.
        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define TRYRUN_LOG_DEBUG(msg) tryrun::core::logging::Logger::get().log(tryrun::core::logging::LogLevel::DEBUG, msg)
    #define TRYRUN_LOG_INFO(msg)  tryrun::core::logging::Logger::get().log(tryrun::core::logging::LogLevel::INFO, msg)
    #define TRYRUN_LOG_WARN(msg)  tryrun::core::logging::Logger::get().log(tryrun::core::logging::LogLevel::WARN, msg)
    #define TRYRUN_LOG_ERROR(msg) tryrun::core::logging::Logger::get().log(tryrun::core::logging::LogLevel::ERROR, msg)

} // namespace tryrun::core::logging
