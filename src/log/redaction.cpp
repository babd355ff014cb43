#include "ingress/log/redaction.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <vector>

namespace ingress {

namespace {

struct RedactionRule {
    std::regex pattern;
    const char* replacement;
};

// Order matters: key-shaped tokens first, then field assignments, then PII.
const std::vector<RedactionRule>& redaction_rules() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    static const std::vector<RedactionRule> rules = {
        // Provider API keys
        {std::regex(R"(sk-[a-zA-Z0-9_\-]{20,})", flags), "sk-***REDACTED***"},
        {std::regex(R"(gsk-[a-zA-Z0-9]{20,})", flags), "gsk-***REDACTED***"},
        {std::regex(R"(claude-[a-zA-Z0-9]{32,})", flags), "claude-***REDACTED***"},
        {std::regex(R"(Bearer\s+[a-zA-Z0-9_\-\.=]+)", flags), "Bearer ***REDACTED***"},

        // Field assignments (JSON and query-string forms)
        {std::regex(R"re(("password"\s*:\s*")[^"]+("))re", flags), "$1***REDACTED***$2"},
        {std::regex(R"re(('password'\s*:\s*')[^']+('))re", flags), "$1***REDACTED***$2"},
        {std::regex(R"((password=)[^\s&]+)", flags), "$1***REDACTED***"},
        {std::regex(R"re(("api_key"\s*:\s*")[^"]+("))re", flags), "$1***REDACTED***$2"},
        {std::regex(R"re(('api_key'\s*:\s*')[^']+('))re", flags), "$1***REDACTED***$2"},
        {std::regex(R"((api_key=)[^\s&]+)", flags), "$1***REDACTED***"},
        {std::regex(R"re(("encryption_key"\s*:\s*")[^"]+("))re", flags), "$1***REDACTED***$2"},
        {std::regex(R"((encryption_key=)[^\s&]+)", flags), "$1***REDACTED***"},

        // Credentials embedded in connection strings / URLs
        {std::regex(R"((://[^:/\s]+:)[^@\s]+(@))", flags), "$1***REDACTED***$2"},

        // Authorization headers
        {std::regex(R"((Authorization:\s*)[^\s]+)", flags), "$1***REDACTED***"},
        {std::regex(R"re(("authorization"\s*:\s*")[^"]+("))re", flags), "$1***REDACTED***$2"},

        // PII, partially masked
        {std::regex(R"(\b([a-zA-Z0-9._%+-]{1,3})[a-zA-Z0-9._%+-]*@([a-zA-Z0-9.-]+\.[a-zA-Z]{2,})\b)", flags),
         "$1***@$2"},
        {std::regex(R"(\b(1[3-9]\d)\d{4}(\d{4})\b)", flags), "$1****$2"},
        {std::regex(R"(\b(\d{6})\d{8}(\d{4})\b)", flags), "$1********$2"},
        {std::regex(R"(\b(\d{4})\d{8,12}(\d{4})\b)", flags), "$1********$2"},
    };
    return rules;
}

constexpr std::array<std::string_view, 15> kSensitiveFieldFragments = {
    "password", "pwd", "passwd",
    "api_key", "apikey", "api_token", "token",
    "secret", "secret_key", "encryption_key",
    "authorization", "auth",
    "private_key", "access_token", "refresh_token"
};

}  // namespace

std::string redact_text(std::string_view text) {
    std::string result(text);
    for (const auto& rule : redaction_rules()) {
        result = std::regex_replace(result, rule.pattern, rule.replacement);
    }
    return result;
}

bool is_sensitive_field_name(std::string_view key) noexcept {
    std::array<char, 128> buffer{};
    if (key.size() >= buffer.size()) {
        // Overlong field names are treated as sensitive rather than truncated.
        return true;
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        buffer[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(key[i])));
    }
    const std::string_view lower(buffer.data(), key.size());

    return std::any_of(kSensitiveFieldFragments.begin(), kSensitiveFieldFragments.end(),
                       [lower](std::string_view fragment) {
                           return lower.find(fragment) != std::string_view::npos;
                       });
}

nlohmann::json redact_fields(const nlohmann::json& data) {
    if (data.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : data) {
            out.push_back(redact_fields(item));
        }
        return out;
    }
    if (!data.is_object()) {
        return data;
    }

    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : data.items()) {
        const bool empty_value = value.is_null() ||
                                 (value.is_string() && value.get_ref<const std::string&>().empty());
        if (is_sensitive_field_name(key)) {
            out[key] = empty_value ? value : nlohmann::json(std::string(kRedactedMarker));
        } else if (value.is_object() || value.is_array()) {
            out[key] = redact_fields(value);
        } else {
            out[key] = value;
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// RedactingLogger
// ─────────────────────────────────────────────────────────────────────────────

RedactingLogger::RedactingLogger(std::unique_ptr<ILogger> inner)
    : inner_(std::move(inner))
{
    if (!inner_) {
        throw std::invalid_argument("RedactingLogger: inner logger cannot be null");
    }
}

void RedactingLogger::log(const LogRecord& record) {
    if (!inner_->should_log(record.level)) {
        return;
    }
    LogRecord scrubbed = record;
    scrubbed.message = redact_text(record.message);
    inner_->log(scrubbed);
}

}  // namespace ingress
