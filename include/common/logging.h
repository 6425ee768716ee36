#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace altprog {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Controls logging verbosity to avoid performance impact in production builds.
 * Instruction processing logs at DEBUG, so the default INFO level keeps the
 * hot path silent.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/// Parse "trace", "DEBUG", ... into a LogLevel
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Structured log entry for JSON logging
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Global logging configuration
 *
 * Thread-safe logging configuration that can be adjusted at runtime.
 * Performance-critical paths should check enabled status before formatting strings.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output (defaults to std::cout); the stream must outlive the logger use
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cout;
    }

    /// Enable/disable async logging
    void set_async_logging(bool enabled) {
        if (enabled && !async_enabled_.load()) {
            start_async_worker();
        } else if (!enabled && async_enabled_.load()) {
            stop_async_worker();
        }
    }

    bool is_async_logging() const noexcept {
        return async_enabled_.load(std::memory_order_relaxed);
    }

    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            oss.str(),
            "",
            {}
        };

        process_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            message,
            error_code,
            context
        };

        process_log_entry(entry);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), async_enabled_(false), worker_shutdown_(false),
               output_(&std::cout) {}

    ~Logger() {
        stop_async_worker();
    }

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::atomic<bool> async_enabled_;
    std::atomic<bool> worker_shutdown_;

    std::mutex output_mutex_;
    std::ostream* output_;

    // Async logging support with bounded queue
    static const size_t MAX_QUEUE_SIZE = 10000;
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread worker_thread_;

    void process_log_entry(const LogEntry& entry) {
        if (async_enabled_.load()) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (log_queue_.size() >= MAX_QUEUE_SIZE) {
                    log_queue_.pop();  // Drop oldest entry
                }
                log_queue_.push(entry);
            }
            queue_cv_.notify_one();
        } else {
            output_log_entry(entry);
        }
    }

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        (*output_) << line << std::endl;
    }

    std::string get_thread_id() const;
    std::string level_to_string(LogLevel level) const;
    std::string escape_json_string(const std::string& input) const;

    void start_async_worker();
    void stop_async_worker();
    void worker_loop();
};

} // namespace common
} // namespace altprog

/**
 * @brief Performance-conscious logging macros
 *
 * These macros avoid string formatting overhead when logging is disabled.
 * The first argument is the module name.
 */
#define LOG_TRACE(...) \
    do { \
        if (altprog::common::Logger::instance().is_enabled(altprog::common::LogLevel::TRACE)) { \
            altprog::common::Logger::instance().log(altprog::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (altprog::common::Logger::instance().is_debug_enabled()) { \
            altprog::common::Logger::instance().log(altprog::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    altprog::common::Logger::instance().log(altprog::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    altprog::common::Logger::instance().log(altprog::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    altprog::common::Logger::instance().log(altprog::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...) \
    altprog::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)
