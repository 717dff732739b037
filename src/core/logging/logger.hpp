#pragma once
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace coderunner::core::logging {

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
        // Singleton access so the whole server shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(const LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Request ids are per worker thread; concurrent handlers never
        // see each other's id.
        static void set_request_id(std::string id) {
            request_id() = std::move(id);
        }

        static const std::string& current_request_id() {
            return request_id();
        }

        void log(LogLevel level, const std::string& message) {
            const std::string& id = request_id();
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << timestamp() << " [" << level_to_string(level) << "] "
                      << (id.empty() ? "" : "[" + id + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string& request_id() {
            thread_local std::string id;
            return id;
        }

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return buffer;
        }

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

    // Binds a request id to the current thread for the lifetime of the scope.
    class ScopedRequestId {
    public:
        explicit ScopedRequestId(std::string id)
            : previous_(Logger::current_request_id()) {
            Logger::set_request_id(std::move(id));
        }
        ~ScopedRequestId() { Logger::set_request_id(previous_); }

        ScopedRequestId(const ScopedRequestId&) = delete;
        ScopedRequestId& operator=(const ScopedRequestId&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define CODERUNNER_LOG_DEBUG(msg) coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::DEBUG, msg)
    #define CODERUNNER_LOG_INFO(msg)  coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::INFO, msg)
    #define CODERUNNER_LOG_WARN(msg)  coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::WARN, msg)
    #define CODERUNNER_LOG_ERROR(msg) coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::ERROR, msg)

} // namespace coderunner::core::logging
