#ifndef INGRESS_SECURITY_URL_SECURITY_ERROR_HPP
#define INGRESS_SECURITY_URL_SECURITY_ERROR_HPP

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace ingress::security {

// ─────────────────────────────────────────────────────────────────────────────
// URL Security Error
// ─────────────────────────────────────────────────────────────────────────────
// One code per rejection cause. None of these is retryable by the validator;
// a caller may retry DnsResolution on its own budget.

struct UrlSecurityError {
    enum class Code {
        UrlFormat,          // Empty, too long, unparseable, bad scheme, userinfo
        DomainNotAllowed,   // Host not covered by the allow list
        PrivateAddress,     // Literal or resolved address in a reserved range
        DnsResolution       // Lookup failed, timed out, or returned nothing
    };

    Code code;
    std::string message;
    std::string url;                      // Sanitised input (safe to log)
    std::optional<std::string> host;
    std::optional<std::string> address;   // Offending address for PrivateAddress

    [[nodiscard]] static UrlSecurityError url_format(std::string url, std::string msg) {
        return {Code::UrlFormat, std::move(msg), std::move(url), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static UrlSecurityError domain_not_allowed(std::string url, std::string host) {
        std::string msg = "Host '" + host + "' is not in the allowed domain list";
        return {Code::DomainNotAllowed, std::move(msg), std::move(url), std::move(host), std::nullopt};
    }

    [[nodiscard]] static UrlSecurityError private_address(
        std::string url, std::string host, std::string address, std::string_view range
    ) {
        std::string msg = "Address " + address + " of host '" + host +
                          "' is in reserved range " + std::string(range);
        return {Code::PrivateAddress, std::move(msg), std::move(url), std::move(host), std::move(address)};
    }

    [[nodiscard]] static UrlSecurityError dns_resolution(std::string url, std::string host, std::string msg) {
        return {Code::DnsResolution, std::move(msg), std::move(url), std::move(host), std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(UrlSecurityError::Code code) noexcept {
    switch (code) {
        case UrlSecurityError::Code::UrlFormat:        return "URLFormatError";
        case UrlSecurityError::Code::DomainNotAllowed: return "DomainNotAllowedError";
        case UrlSecurityError::Code::PrivateAddress:   return "PrivateAddressError";
        case UrlSecurityError::Code::DnsResolution:    return "DNSResolutionError";
    }
    return "Unknown";
}

}  // namespace ingress::security

#endif  // INGRESS_SECURITY_URL_SECURITY_ERROR_HPP
