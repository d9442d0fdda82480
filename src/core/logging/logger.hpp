#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace costbridge::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr because stdout carries the JSON
    // result of the CLI.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
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

    #define CB_LOG_DEBUG(msg) costbridge::core::logging::Logger::get().log(costbridge::core::logging::LogLevel::DEBUG, msg)
    #define CB_LOG_INFO(msg)  costbridge::core::logging::Logger::get().log(costbridge::core::logging::LogLevel::INFO, msg)
    #define CB_LOG_WARN(msg)  costbridge::core::logging::Logger::get().log(costbridge::core::logging::LogLevel::WARN, msg)
    #define CB_LOG_ERROR(msg) costbridge::core::logging::Logger::get().log(costbridge::core::logging::LogLevel::ERROR, msg)

} // namespace costbridge::core::logging
