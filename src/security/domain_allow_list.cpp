#include "ingress/security/domain_allow_list.hpp"
#include "ingress/log/logger.hpp"

#include <algorithm>
#include <cctype>

namespace ingress::security {

namespace {

constexpr std::string_view kComponent = "url";

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

[[nodiscard]] bool is_domain_char(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '.' || c == '-' || c == '_';
}

}  // namespace

std::string normalize_domain(std::string_view domain) {
    domain = trim(domain);
    if (domain.starts_with("*.")) {
        domain.remove_prefix(2);
    }
    while (domain.starts_with('.')) domain.remove_prefix(1);
    while (domain.ends_with('.')) domain.remove_suffix(1);

    if (domain.empty() || domain.find("..") != std::string_view::npos) {
        return {};
    }
    if (!std::all_of(domain.begin(), domain.end(), is_domain_char)) {
        return {};
    }

    std::string out(domain);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split_domain_list(std::string_view csv) {
    std::vector<std::string> out;
    while (!csv.empty()) {
        const auto comma = csv.find(',');
        const auto item = trim(csv.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) break;
        csv.remove_prefix(comma + 1);
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// DomainAllowList
// ─────────────────────────────────────────────────────────────────────────────

DomainAllowList::DomainAllowList(const std::vector<std::string>& domains, Mode mode)
    : mode_(mode)
{
    for (const auto& entry : domains) {
        auto normalized = normalize_domain(entry);
        if (normalized.empty()) {
            get_logger().warn_fmt(kComponent, "Ignoring malformed allow-list entry '{}'", entry);
            continue;
        }
        domains_.insert(std::move(normalized));
    }

    if (mode_ == Mode::Disabled) {
        get_logger().warn(kComponent,
            "!!! DOMAIN ALLOW LIST DISABLED (development mode) !!! "
            "Any public host will be fetched. Never run production with DEV_MODE enabled.");
    }
}

DomainAllowList DomainAllowList::with_defaults(std::string_view extra_csv, Mode mode) {
    std::vector<std::string> domains(kDefaultAllowedDomains.begin(), kDefaultAllowedDomains.end());
    const auto extra = split_domain_list(extra_csv);
    if (!extra.empty()) {
        get_logger().info_fmt(kComponent, "Loaded {} additional allowed domain(s) from configuration",
                              extra.size());
        domains.insert(domains.end(), extra.begin(), extra.end());
    }
    return DomainAllowList(domains, mode);
}

bool DomainAllowList::allows(std::string_view host) const {
    if (mode_ == Mode::Disabled) {
        get_logger().warn_fmt(kComponent, "Development mode: skipping allow-list check for '{}'", host);
        return true;
    }

    const auto normalized = normalize_domain(host);
    if (normalized.empty()) {
        return false;
    }
    if (domains_.contains(normalized)) {
        return true;
    }

    // Walk parent domains: a.b.example.com -> b.example.com -> example.com -> com
    std::string_view rest = normalized;
    for (auto dot = rest.find('.'); dot != std::string_view::npos; dot = rest.find('.')) {
        rest.remove_prefix(dot + 1);
        if (domains_.contains(std::string(rest))) {
            return true;
        }
    }
    return false;
}

}  // namespace ingress::security
