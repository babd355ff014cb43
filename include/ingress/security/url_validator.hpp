#ifndef INGRESS_SECURITY_URL_VALIDATOR_HPP
#define INGRESS_SECURITY_URL_VALIDATOR_HPP

#include "ingress/security/domain_allow_list.hpp"
#include "ingress/security/host_resolver.hpp"
#include "ingress/security/url_security_error.hpp"

#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ingress::security {

// ═══════════════════════════════════════════════════════════════════════════
// URL Validation Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct UrlValidationConfig {
    std::size_t max_url_length = 2048;
    std::chrono::milliseconds dns_timeout{3000};
};

// ═══════════════════════════════════════════════════════════════════════════
// ValidatedUrl
// ═══════════════════════════════════════════════════════════════════════════
// Proof that a URL passed every check below. Only validate_url() can create
// one. The addresses are the ones observed at validation time; the fetch must
// connect to one of them rather than resolving the host again, otherwise a
// rebinding DNS server gets a second chance.

class ValidatedUrl {
public:
    [[nodiscard]] const std::string& href() const noexcept { return href_; }
    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] bool is_https() const noexcept { return scheme_ == "https"; }

    /// Hostname without IPv6 brackets ("example.com", "2001:db8::1").
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// Never empty.
    [[nodiscard]] const std::vector<asio::ip::address>& addresses() const noexcept {
        return addresses_;
    }

    [[nodiscard]] bool is_ip_literal() const noexcept { return ip_literal_; }

    [[nodiscard]] std::vector<asio::ip::tcp::endpoint> pinned_endpoints() const;

    /// libcurl CURLOPT_RESOLVE entries: "host:port:address". Empty for an
    /// IP-literal host, which needs no lookup.
    [[nodiscard]] std::vector<std::string> resolve_entries() const;

private:
    friend tl::expected<ValidatedUrl, UrlSecurityError> validate_url(
        std::string_view raw,
        const DomainAllowList& allow_list,
        IHostResolver& resolver,
        const UrlValidationConfig& config
    );

    ValidatedUrl() = default;

    std::string href_;
    std::string scheme_;
    std::string host_;
    std::uint16_t port_{0};
    std::string path_;
    std::vector<asio::ip::address> addresses_;
    bool ip_literal_{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// URL Validation
// ═══════════════════════════════════════════════════════════════════════════
// Decide whether the server may fetch `raw`. Checks, in order:
//
//   1. sanitise; reject empty or longer than max_url_length
//   2. WHATWG parse (ada); scheme must be http or https
//   3. no userinfo, host present
//   4. IP-literal host: reserved range -> PrivateAddress (no DNS)
//   5. host covered by the allow list (skipped in development mode)
//   6. resolve with a timeout; failure or no addresses -> DnsResolution
//   7. every resolved address outside the reserved ranges
//
// Every rejection is logged at warn level with the sanitised URL.

[[nodiscard]] tl::expected<ValidatedUrl, UrlSecurityError> validate_url(
    std::string_view raw,
    const DomainAllowList& allow_list,
    IHostResolver& resolver,
    const UrlValidationConfig& config = {}
);

/// Trim surrounding whitespace and remove percent-encoded CR, LF and NUL
/// (%0d, %0a, %00 in any case) until none remain.
[[nodiscard]] std::string sanitize_url(std::string_view raw);

}  // namespace ingress::security

#endif  // INGRESS_SECURITY_URL_VALIDATOR_HPP
