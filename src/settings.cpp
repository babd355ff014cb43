#include "ingress/settings.hpp"
#include "ingress/upload/file_validator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace ingress {

namespace {

constexpr std::string_view kComponent = "settings";

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::size_t> parse_size(const char* name, const std::string& value) {
    std::size_t out = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        get_logger().warn_fmt(kComponent, "Ignoring {}='{}': not a non-negative integer", name, value);
        return std::nullopt;
    }
    return out;
}

}  // namespace

bool parse_env_flag(std::string_view value) noexcept {
    char buf[8] = {};
    if (value.size() >= sizeof(buf)) {
        return false;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        buf[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(value[i])));
    }
    const std::string_view lowered(buf, value.size());
    return lowered == "true" || lowered == "1" || lowered == "yes";
}

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

IngressSettings& IngressSettings::with_encryption_key(const std::string& key) {
    encryption_key = key;
    return *this;
}

IngressSettings& IngressSettings::with_allowed_domain(const std::string& domain) {
    extra_allowed_domains.push_back(domain);
    return *this;
}

IngressSettings& IngressSettings::with_dev_mode(bool enabled) {
    dev_mode = enabled;
    return *this;
}

IngressSettings& IngressSettings::with_dns_timeout(std::chrono::milliseconds timeout) {
    dns_timeout = timeout;
    return *this;
}

IngressSettings& IngressSettings::with_max_upload_mb(std::size_t mb) {
    max_upload_mb = mb;
    return *this;
}

IngressSettings& IngressSettings::with_allowed_extension(const std::string& extension) {
    allowed_extensions.insert(extension);
    return *this;
}

IngressSettings& IngressSettings::with_log_level(LogLevel level) {
    log_level = level;
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

std::string IngressSettings::validation_error() const {
    if (max_upload_mb == 0) return "Upload size limit must be at least 1 MB";
    if (max_upload_mb > upload::kMaxUploadLimitMb) {
        return "Upload size limit must be at most " + std::to_string(upload::kMaxUploadLimitMb) + " MB";
    }
    if (dns_timeout.count() <= 0) return "DNS timeout must be positive";
    if (max_url_length == 0) return "Maximum URL length must be positive";
    if (allowed_extensions.empty()) return "At least one upload extension must be allowed";
    if (encryption_key && encryption_key->empty()) return "Encryption key is set but empty";
    return "";
}

// ─────────────────────────────────────────────────────────────────────────────
// Derived objects
// ─────────────────────────────────────────────────────────────────────────────

security::DomainAllowList IngressSettings::make_allow_list() const {
    std::vector<std::string> domains(security::kDefaultAllowedDomains.begin(),
                                     security::kDefaultAllowedDomains.end());
    domains.insert(domains.end(), extra_allowed_domains.begin(), extra_allowed_domains.end());
    return security::DomainAllowList(
        domains,
        dev_mode ? security::DomainAllowList::Mode::Disabled : security::DomainAllowList::Mode::Enforced);
}

security::UrlValidationConfig IngressSettings::url_config() const {
    security::UrlValidationConfig config;
    config.max_url_length = max_url_length;
    config.dns_timeout = dns_timeout;
    return config;
}

IngressSettings IngressSettings::from_environment() {
    IngressSettings settings;

    if (auto key = get_env("ENCRYPTION_KEY")) {
        settings.encryption_key = std::move(key);
    } else if (auto legacy = get_env("CONFIG_ENCRYPTION_KEY")) {
        settings.encryption_key = std::move(legacy);
    }

    if (auto domains = get_env("ALLOWED_IMAGE_DOMAINS")) {
        settings.extra_allowed_domains = security::split_domain_list(*domains);
    }

    if (auto dev = get_env("DEV_MODE")) {
        settings.dev_mode = parse_env_flag(*dev);
    }

    if (auto mb = get_env("INGRESS_MAX_UPLOAD_MB")) {
        if (auto parsed = parse_size("INGRESS_MAX_UPLOAD_MB", *mb)) {
            settings.max_upload_mb = *parsed;
        }
    }

    if (auto ms = get_env("INGRESS_DNS_TIMEOUT_MS")) {
        if (auto parsed = parse_size("INGRESS_DNS_TIMEOUT_MS", *ms)) {
            settings.dns_timeout = std::chrono::milliseconds(static_cast<long long>(*parsed));
        }
    }

    if (auto level = get_env("INGRESS_LOG_LEVEL")) {
        settings.log_level = parse_log_level(*level, LogLevel::Info);
    }

    return settings;
}

}  // namespace ingress
