#include "ingress/security/url_validator.hpp"
#include "ingress/security/address_ranges.hpp"
#include "ingress/log/logger.hpp"

#include <ada.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ingress::security {

namespace {

constexpr std::string_view kComponent = "url";

[[nodiscard]] bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "%0d" / "%0A" / "%00" starting at `pos`
[[nodiscard]] bool is_encoded_control(std::string_view s, std::size_t pos) noexcept {
    if (pos + 3 > s.size() || s[pos] != '%' || s[pos + 1] != '0') {
        return false;
    }
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(s[pos + 2])));
    return c == 'd' || c == 'a' || c == '0';
}

// WHATWG silently drops an empty userinfo ("http://@host/"), so look at the
// raw authority as well as the parsed fields.
[[nodiscard]] bool raw_authority_has_userinfo(std::string_view url) noexcept {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return false;
    }
    auto authority = url.substr(scheme_end + 3);
    const auto end = authority.find_first_of("/\\?#");
    if (end != std::string_view::npos) {
        authority = authority.substr(0, end);
    }
    return authority.find('@') != std::string_view::npos;
}

// "http://user:pw@host/x" -> "http://***@host/x", for error reports
[[nodiscard]] std::string mask_userinfo(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::string(url);
    }
    const auto authority_start = scheme_end + 3;
    auto authority_end = url.find_first_of("/\\?#", authority_start);
    if (authority_end == std::string_view::npos) {
        authority_end = url.size();
    }
    const auto at = url.substr(0, authority_end).rfind('@');
    if (at == std::string_view::npos || at < authority_start) {
        return std::string(url);
    }
    return std::string(url.substr(0, authority_start)) + "***" + std::string(url.substr(at));
}

[[nodiscard]] std::string strip_brackets(std::string_view host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return std::string(host);
}

[[nodiscard]] tl::unexpected<UrlSecurityError> reject(UrlSecurityError error) {
    get_logger().warn_fmt(kComponent, "{}: {} (url: {})", to_string(error.code), error.message, error.url);
    return tl::unexpected(std::move(error));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ValidatedUrl
// ═══════════════════════════════════════════════════════════════════════════

std::vector<asio::ip::tcp::endpoint> ValidatedUrl::pinned_endpoints() const {
    std::vector<asio::ip::tcp::endpoint> endpoints;
    endpoints.reserve(addresses_.size());
    for (const auto& address : addresses_) {
        endpoints.emplace_back(address, port_);
    }
    return endpoints;
}

std::vector<std::string> ValidatedUrl::resolve_entries() const {
    std::vector<std::string> entries;
    if (ip_literal_) {
        return entries;
    }
    entries.reserve(addresses_.size());
    for (const auto& address : addresses_) {
        std::string addr = address.to_string();
        if (address.is_v6()) {
            addr = "[" + addr + "]";
        }
        entries.push_back(host_ + ":" + std::to_string(port_) + ":" + addr);
    }
    return entries;
}

// ═══════════════════════════════════════════════════════════════════════════
// Sanitisation
// ═══════════════════════════════════════════════════════════════════════════

std::string sanitize_url(std::string_view raw) {
    while (!raw.empty() && is_space(raw.front())) raw.remove_prefix(1);
    while (!raw.empty() && is_space(raw.back())) raw.remove_suffix(1);

    std::string current(raw);
    // Removing one sequence can splice another together ("%0%0dd"), so
    // repeat until a pass changes nothing.
    bool changed = true;
    while (changed) {
        changed = false;
        std::string next;
        next.reserve(current.size());
        for (std::size_t i = 0; i < current.size();) {
            if (is_encoded_control(current, i)) {
                i += 3;
                changed = true;
            } else {
                next.push_back(current[i++]);
            }
        }
        current = std::move(next);
    }
    return current;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main Validation Function
// ═══════════════════════════════════════════════════════════════════════════

tl::expected<ValidatedUrl, UrlSecurityError> validate_url(
    std::string_view raw,
    const DomainAllowList& allow_list,
    IHostResolver& resolver,
    const UrlValidationConfig& config
) {
    const std::string url = sanitize_url(raw);

    if (url.empty()) {
        return reject(UrlSecurityError::url_format(url, "URL is empty"));
    }
    if (url.size() > config.max_url_length) {
        return reject(UrlSecurityError::url_format(
            url.substr(0, 128) + "...",
            "URL is longer than " + std::to_string(config.max_url_length) + " characters"));
    }

    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return reject(UrlSecurityError::url_format(url, "Invalid URL format"));
    }
    const auto& ada_url = *parsed;

    std::string scheme = std::string(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }
    if (scheme != "http" && scheme != "https") {
        return reject(UrlSecurityError::url_format(url, "Only HTTP/HTTPS URLs are allowed"));
    }

    if (!ada_url.get_username().empty() || !ada_url.get_password().empty() ||
        raw_authority_has_userinfo(url)) {
        return reject(UrlSecurityError::url_format(mask_userinfo(url),
                                                   "URLs with embedded credentials are not allowed"));
    }

    const std::string host = strip_brackets(ada_url.get_hostname());
    if (host.empty()) {
        return reject(UrlSecurityError::url_format(url, "URL has no host"));
    }

    std::uint16_t port = scheme == "https" ? 443 : 80;
    const std::string port_str = std::string(ada_url.get_port());
    if (!port_str.empty()) {
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0) {
            return reject(UrlSecurityError::url_format(url, "Invalid port: " + port_str));
        }
    }

    ValidatedUrl result;
    result.href_ = std::string(ada_url.get_href());
    result.scheme_ = scheme;
    result.host_ = host;
    result.port_ = port;
    result.path_ = std::string(ada_url.get_pathname());

    // Literal addresses never touch DNS; the reserved check comes before the
    // allow list so metadata endpoints are reported as what they are.
    if (const auto literal = parse_ip_literal(host)) {
        if (const auto range = reserved_range_of(*literal)) {
            return reject(UrlSecurityError::private_address(url, host, literal->to_string(), *range));
        }
        if (!allow_list.allows(host)) {
            return reject(UrlSecurityError::domain_not_allowed(url, host));
        }
        result.addresses_.push_back(*literal);
        result.ip_literal_ = true;
        get_logger().info_fmt(kComponent, "URL validated: {} (literal address {})", result.href_, host);
        return result;
    }

    if (!allow_list.allows(host)) {
        return reject(UrlSecurityError::domain_not_allowed(url, host));
    }

    auto resolved = resolver.resolve(host, port, config.dns_timeout);
    if (!resolved) {
        const auto& err = resolved.error();
        std::string msg;
        switch (err.code) {
            case ResolveError::Code::NotFound:
                msg = "Host '" + host + "' could not be resolved: " + err.message;
                break;
            case ResolveError::Code::Timeout:
                msg = "DNS resolution for '" + host + "' timed out: " + err.message;
                break;
            case ResolveError::Code::Failed:
                msg = "DNS resolution for '" + host + "' failed: " + err.message;
                break;
        }
        return reject(UrlSecurityError::dns_resolution(url, host, std::move(msg)));
    }
    if (resolved->empty()) {
        return reject(UrlSecurityError::dns_resolution(url, host, "Host '" + host + "' has no addresses"));
    }

    // Every answer is checked, not just the first: a rebinding server can
    // mix one public and one internal record.
    for (const auto& address : *resolved) {
        if (const auto range = reserved_range_of(address)) {
            return reject(UrlSecurityError::private_address(url, host, address.to_string(), *range));
        }
    }

    result.addresses_ = std::move(*resolved);
    get_logger().info_fmt(kComponent, "URL validated: {} -> {} address(es)", result.href_,
                          result.addresses_.size());
    return result;
}

}  // namespace ingress::security
