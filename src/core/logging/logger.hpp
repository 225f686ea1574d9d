#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace harbor::core::logging {

    // 1. Log levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger setup
    // One sink for the whole process; per-session detail goes in the message.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_label(const std::string& label) {
            std::lock_guard<std::mutex> lock(mutex_);
            label_ = label;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // stdout carries the conversation answer, so logs go to stderr
            std::cerr << "[" << level_to_string(level) << "] "
                      << (label_.empty() ? "" : "[" + label_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string label_;
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
    #define HARBOR_LOG_DEBUG(msg) harbor::core::logging::Logger::get().log(harbor::core::logging::LogLevel::DEBUG, msg)
    #define HARBOR_LOG_INFO(msg)  harbor::core::logging::Logger::get().log(harbor::core::logging::LogLevel::INFO, msg)
    #define HARBOR_LOG_WARN(msg)  harbor::core::logging::Logger::get().log(harbor::core::logging::LogLevel::WARN, msg)
    #define HARBOR_LOG_ERROR(msg) harbor::core::logging::Logger::get().log(harbor::core::logging::LogLevel::ERROR, msg)

} // namespace harbor::core::logging
