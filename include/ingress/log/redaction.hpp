#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Log Redaction
// ═══════════════════════════════════════════════════════════════════════════
// Secrets must never reach a log sink. Components in this library do not log
// secret values in the first place; RedactingLogger is the second line for
// messages composed by the host application (request dumps, upstream error
// bodies) that may echo an API key or credential back.
//
// Usage:
//   set_logger(std::make_unique<RedactingLogger>(make_spdlog_console_logger()));

#include "ingress/log/logger.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace ingress {

inline constexpr std::string_view kRedactedMarker = "***REDACTED***";

/// Scrub API keys, bearer tokens, password/api_key/encryption_key
/// assignments, URL credentials, Authorization headers and common PII
/// (email, phone, id and card numbers) from free text.
[[nodiscard]] std::string redact_text(std::string_view text);

/// Recursively replace non-empty values whose key looks sensitive
/// ("password", "api_key", "token", "secret", "authorization", ...) with
/// kRedactedMarker. Arrays are walked; non-object values are returned as is.
[[nodiscard]] nlohmann::json redact_fields(const nlohmann::json& data);

/// True when a field name should never be echoed (substring match,
/// case-insensitive).
[[nodiscard]] bool is_sensitive_field_name(std::string_view key) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// RedactingLogger - ILogger decorator
// ─────────────────────────────────────────────────────────────────────────────

class RedactingLogger final : public ILogger {
public:
    explicit RedactingLogger(std::unique_ptr<ILogger> inner);

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return inner_->should_log(level);
    }

    [[nodiscard]] ILogger& inner() noexcept { return *inner_; }

private:
    std::unique_ptr<ILogger> inner_;
};

}  // namespace ingress
