/**
 * skymesh - Logging System
 *
 * Structured logging with configurable levels.
 * Thread-safe; batch workers log from several threads at once.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>

namespace skymesh {

/**
 * Log severity levels
 */
enum class LogLevel {
    Debug = 0,   // Strategy traces, offsets, candidate rejections
    Info = 1,    // Per-file results
    Warning = 2, // Recoverable problems (bad settings, unreadable defs)
    Error = 3,   // Fatal conditions
    None = 4     // Disable all logging
};

constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * Parse a level name ("debug", "info", "warn", "error", "none").
 * Unknown names map to Info.
 */
LogLevel parse_log_level(std::string_view name);

/**
 * Thread-safe logger with level filtering
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Set minimum log level (messages below it are dropped before formatting)
     */
    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    /**
     * Check if a log level is enabled (for macro optimization)
     * Lock-free, read on every LOG_* expansion
     */
    bool is_enabled(LogLevel level) const {
        return level >= min_level_.load(std::memory_order_acquire);
    }

    /**
     * Enable/disable console output (off until the CLI turns it on)
     */
    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    /**
     * Set log file path (truncates and writes a header line)
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_.is_open()) {
            file_.close();
        }

        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_.is_open()) {
            return false;
        }

        std::tm tm_buf = local_time(std::chrono::system_clock::now());
        file_ << "=== skymesh log - "
              << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " ===\n\n";
        file_.flush();
        return true;
    }

    /**
     * Close log file, writing the end marker
     */
    void close_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_ << "\n=== Log End ===\n";
            file_.close();
        }
    }

    /**
     * Set callback receiving every formatted line (tests use it to capture traces)
     */
    void set_callback(std::function<void(LogLevel, const std::string&)> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    /**
     * Log a message at the specified level to every enabled sink
     */
    template<typename... Args>
    void log(LogLevel level, std::string_view tag, std::string_view format, Args&&... args) {
        if (!is_enabled(level)) return;

        std::string message = format_message(level, tag, format, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);

        if (console_enabled_) {
            // Warnings and errors go to cerr so progress output stays clean
            auto& stream = (level >= LogLevel::Warning) ? std::cerr : std::cout;
            stream << message << std::endl;
        }

        if (file_.is_open()) {
            file_ << message << '\n';
            file_.flush();
        }

        if (callback_) {
            callback_(level, message);
        }
    }

    // Convenience methods
    template<typename... Args>
    void debug(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Debug, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Info, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Warning, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Error, tag, format, std::forward<Args>(args)...);
    }

private:
    // Quiet by default: library users and tests opt into output
    Logger() = default;
    ~Logger() {
        if (file_.is_open()) {
            file_ << "\n=== Log End ===\n";
            file_.close();
        }
    }

    static std::tm local_time(std::chrono::system_clock::time_point now) {
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        return tm_buf;
    }

    template<typename... Args>
    std::string format_message(LogLevel level, std::string_view tag,
                               std::string_view format, Args&&... args) {
        std::ostringstream ss;

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm tm_buf = local_time(now);

        ss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << ' ';

        ss << '[' << log_level_string(level) << "] ";

        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }

        ss << format;
        ((ss << args), ...);

        return ss.str();
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    bool console_enabled_ = false;
    std::ofstream file_;
    std::function<void(LogLevel, const std::string&)> callback_;
};

// Stream-based logging macros - usage: LOG_INFO("Tag", "message " << value << " more")
#define LOG_DEBUG(tag, msg) \
    do { \
        if (skymesh::Logger::instance().is_enabled(skymesh::LogLevel::Debug)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            skymesh::Logger::instance().debug(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_INFO(tag, msg) \
    do { \
        if (skymesh::Logger::instance().is_enabled(skymesh::LogLevel::Info)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            skymesh::Logger::instance().info(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_WARNING(tag, msg) \
    do { \
        if (skymesh::Logger::instance().is_enabled(skymesh::LogLevel::Warning)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            skymesh::Logger::instance().warn(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_WARN(tag, msg) LOG_WARNING(tag, msg)

#define LOG_ERROR(tag, msg) \
    do { \
        if (skymesh::Logger::instance().is_enabled(skymesh::LogLevel::Error)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            skymesh::Logger::instance().error(tag, _log_ss.str()); \
        } \
    } while(0)

// Decode tracing, switched per call by DecodeOptions::trace instead of global state
#define SKYMESH_TRACE(options, tag, msg) \
    do { \
        if ((options).trace) { \
            LOG_DEBUG(tag, msg); \
        } \
    } while(0)

} // namespace skymesh
