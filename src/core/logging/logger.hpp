#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace snipvisor::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr: stdout is reserved for protocol
    // lines in the worker and for result records in the CLI.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_instance_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            instance_tag_ = tag;
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

            std::cerr << "[" << level_to_string(level) << "] "
                      << (instance_tag_.empty() ? "" : "[" + instance_tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string instance_tag_;
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

    #define SNIPVISOR_LOG_DEBUG(msg) snipvisor::core::logging::Logger::get().log(snipvisor::core::logging::LogLevel::DEBUG, msg)
    #define SNIPVISOR_LOG_INFO(msg)  snipvisor::core::logging::Logger::get().log(snipvisor::core::logging::LogLevel::INFO, msg)
    #define SNIPVISOR_LOG_WARN(msg)  snipvisor::core::logging::Logger::get().log(snipvisor::core::logging::LogLevel::WARN, msg)
    #define SNIPVISOR_LOG_ERROR(msg) snipvisor::core::logging::Logger::get().log(snipvisor::core::logging::LogLevel::ERROR, msg)

} // namespace snipvisor::core::logging
