#include "ingress/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace ingress {

namespace {

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) noexcept {
    if (iequals(name, "trace")) return LogLevel::Trace;
    if (iequals(name, "debug")) return LogLevel::Debug;
    if (iequals(name, "info"))  return LogLevel::Info;
    if (iequals(name, "warn") || iequals(name, "warning")) return LogLevel::Warn;
    if (iequals(name, "error")) return LogLevel::Error;
    if (iequals(name, "fatal") || iequals(name, "critical")) return LogLevel::Fatal;
    if (iequals(name, "off"))   return LogLevel::Off;
    return fallback;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace ingress
