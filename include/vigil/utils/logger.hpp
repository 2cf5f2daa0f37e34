#pragma once
// ============================================================================
// VIGIL - Logger
// ============================================================================
// Thin wrapper around a process-wide spdlog logger
// Console sink always, rotating file sink when a log file is configured
// ============================================================================

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace vigil::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"
[[nodiscard]] LogLevel parse_log_level(std::string_view name);

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file;           // Empty = console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    bool async = true;
    size_t queue_size = 8192;
    size_t flush_interval_ms = 1000;

    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger (replaces the lazy console default)
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush and drop all sinks
    static void shutdown();

    /// Global instance; falls back to a console logger if never initialized
    static Logger& instance();

    void set_level(LogLevel level);

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(spdlog::level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args) {
        log(spdlog::level::critical, fmt, std::forward<Args>(args)...);
    }

    void flush();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    template <typename... Args>
    void log(spdlog::level::level_enum lvl, std::string_view format, Args&&... args) {
        auto sink = get();
        if (!sink->should_log(lvl)) return;
        sink->log(lvl, fmt::runtime(format), std::forward<Args>(args)...);
    }

    [[nodiscard]] std::shared_ptr<spdlog::logger> get();

    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::vigil::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::vigil::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::vigil::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::vigil::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::vigil::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::vigil::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define VIGIL_CONCAT_INNER(a, b) a##b
#define VIGIL_CONCAT(a, b) VIGIL_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::vigil::utils::ScopedTimer VIGIL_CONCAT(_timer_, __LINE__)(name)

}  // namespace vigil::utils
