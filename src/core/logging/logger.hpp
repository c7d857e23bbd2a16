#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace bridge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // stdout carries the protocol, so everything here goes to stderr
    // (and optionally a mirror file).
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

        // Returns false when the file cannot be opened; logging then stays stderr-only.
        bool set_log_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
            file_.clear();
            file_.open(path, std::ios::app);
            return file_.is_open();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            const std::string line = timestamp_utc() + " [" + level_to_string(level) + "] " +
                                     (session_id_.empty() ? "" : "[" + session_id_ + "] ") +
                                     message;
            std::cerr << line << std::endl;
            if (file_.is_open()) {
                file_ << line << std::endl;
            }
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream file_;

        static std::string timestamp_utc() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()) % 1000;

            std::tm utc{};
            gmtime_r(&seconds, &utc);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
            char with_millis[40];
            std::snprintf(with_millis, sizeof(with_millis), "%s.%03dZ", buffer,
                          static_cast<int>(millis.count()));
            return with_millis;
        }

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
    #define LOG_DEBUG(msg) bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::ERROR, msg)

} // namespace bridge::core::logging
