#ifndef INGRESS_SETTINGS_HPP
#define INGRESS_SETTINGS_HPP

#include "ingress/log/logger.hpp"
#include "ingress/security/domain_allow_list.hpp"
#include "ingress/security/url_validator.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ingress {

// ═══════════════════════════════════════════════════════════════════════════
// Ingress Settings
// ═══════════════════════════════════════════════════════════════════════════
// Everything an operator can tune. Built once at startup, usually with
// from_environment(), and read-only afterwards.
//
// Environment variables:
//   ENCRYPTION_KEY           urlsafe-base64 Fernet key (CONFIG_ENCRYPTION_KEY
//                            is accepted as a fallback name)
//   ALLOWED_IMAGE_DOMAINS    comma-separated extra domains for image fetches
//   DEV_MODE                 "true" / "1" / "yes" disables the allow list
//   INGRESS_MAX_UPLOAD_MB    upload ceiling in MiB (default 50)
//   INGRESS_DNS_TIMEOUT_MS   DNS resolution timeout (default 3000)
//   INGRESS_LOG_LEVEL        debug / info / warn / error / off (default info)

struct IngressSettings {
    // ─────────────────────────────────────────────────────────────────────────
    // Secrets
    // ─────────────────────────────────────────────────────────────────────────

    // Explicit key. When absent a host-bound key is derived instead.
    std::optional<std::string> encryption_key;

    // Host identifier source for the derived key.
    std::filesystem::path machine_id_path{"/etc/machine-id"};

    // ─────────────────────────────────────────────────────────────────────────
    // URL fetching
    // ─────────────────────────────────────────────────────────────────────────

    std::vector<std::string> extra_allowed_domains;

    // Skips the domain allow list. Address checks still apply.
    bool dev_mode{false};

    std::chrono::milliseconds dns_timeout{3000};
    std::size_t max_url_length{2048};

    // ─────────────────────────────────────────────────────────────────────────
    // Uploads
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_upload_mb{50};
    std::set<std::string> allowed_extensions{".pdf"};

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    LogLevel log_level{LogLevel::Info};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    IngressSettings& with_encryption_key(const std::string& key);
    IngressSettings& with_allowed_domain(const std::string& domain);
    IngressSettings& with_dev_mode(bool enabled);
    IngressSettings& with_dns_timeout(std::chrono::milliseconds timeout);
    IngressSettings& with_max_upload_mb(std::size_t mb);
    IngressSettings& with_allowed_extension(const std::string& extension);
    IngressSettings& with_log_level(LogLevel level);

    // ─────────────────────────────────────────────────────────────────────────
    // Validation
    // ─────────────────────────────────────────────────────────────────────────

    /// Empty if valid.
    [[nodiscard]] std::string validation_error() const;

    [[nodiscard]] bool is_valid() const { return validation_error().empty(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Derived objects
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] security::DomainAllowList make_allow_list() const;
    [[nodiscard]] security::UrlValidationConfig url_config() const;

    /// Read the variables listed above. Unset variables keep their defaults;
    /// malformed numeric values are logged and ignored.
    [[nodiscard]] static IngressSettings from_environment();
};

/// "true", "1", "yes" (any case) -> true.
[[nodiscard]] bool parse_env_flag(std::string_view value) noexcept;

}  // namespace ingress

#endif  // INGRESS_SETTINGS_HPP
