#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace ingress {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,  // Rejections and degraded-but-accepted input
    Error = 4,  // Operation failed (crypto failure, storage failure)
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "fatal" / "off"
/// (case-insensitive). Unknown names yield `fallback`.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// `component` names the subsystem that emitted the record ("url", "upload",
// "config", "crypto", "fetch"). It is always a string literal.

struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }

    void debug(std::string_view component, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, component, msg, loc);
    }

    void info(std::string_view component, std::string_view msg,
              std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, component, msg, loc);
    }

    void warn(std::string_view component, std::string_view msg,
              std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, component, msg, loc);
    }

    void error(std::string_view component, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, component, msg, loc);
    }

    // std::format helpers. Arguments are only formatted when the level is on.
    template<typename... Args>
    void info_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default until the host application installs a real backend
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

/// Install a logger (takes ownership). nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define INGRESS_LOG_DEBUG(component, msg) \
    do { if (::ingress::get_logger().should_log(::ingress::LogLevel::Debug)) \
         ::ingress::get_logger().debug(component, msg); } while(false)

#define INGRESS_LOG_INFO(component, msg) \
    do { if (::ingress::get_logger().should_log(::ingress::LogLevel::Info)) \
         ::ingress::get_logger().info(component, msg); } while(false)

#define INGRESS_LOG_WARN(component, msg) \
    do { if (::ingress::get_logger().should_log(::ingress::LogLevel::Warn)) \
         ::ingress::get_logger().warn(component, msg); } while(false)

#define INGRESS_LOG_ERROR(component, msg) \
    do { if (::ingress::get_logger().should_log(::ingress::LogLevel::Error)) \
         ::ingress::get_logger().error(component, msg); } while(false)

}  // namespace ingress
