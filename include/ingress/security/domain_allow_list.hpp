#ifndef INGRESS_SECURITY_DOMAIN_ALLOW_LIST_HPP
#define INGRESS_SECURITY_DOMAIN_ALLOW_LIST_HPP

#include <array>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ingress::security {

// ═══════════════════════════════════════════════════════════════════════════
// Domain Allow List
// ═══════════════════════════════════════════════════════════════════════════
// Host suffixes the server may fetch images from. A host matches an entry if
// it equals the entry or ends with "." + entry (so "a.xhscdn.com" matches
// "xhscdn.com" but "evilxhscdn.com" does not). Matching is case-insensitive
// and ignores a trailing root dot.
//
// The list is fixed once constructed. Disabled mode skips the check entirely
// and exists only for local development; it logs a warning at construction and
// on every host it lets through.

inline constexpr std::array<std::string_view, 25> kDefaultAllowedDomains = {
    // Social platforms
    "pbs.twimg.com", "abs.twimg.com",
    "xhscdn.com", "ci.xiaohongshu.com", "sns-webpic-qc.xhscdn.com",
    "sinaimg.cn", "ws1.sinaimg.cn", "ws2.sinaimg.cn", "ws3.sinaimg.cn", "ws4.sinaimg.cn",
    "p16-sign.tiktokcdn.com", "p16.tiktokcdn.com", "p9-sign.douyinpic.com",
    // Image hosts and CDNs
    "imgur.com", "i.imgur.com", "cloudinary.com",
    "unsplash.com", "images.unsplash.com", "pexels.com", "images.pexels.com",
    // Cloud storage
    "amazonaws.com", "cloudfront.net", "googleusercontent.com", "azureedge.net",
    "githubusercontent.com",
};

class DomainAllowList {
public:
    enum class Mode {
        Enforced,
        Disabled   // Development only
    };

    /// Build from explicit entries. Entries are normalised (trimmed,
    /// lower-cased, leading "*." / "." and trailing "." removed); malformed
    /// entries are dropped with a warning.
    explicit DomainAllowList(const std::vector<std::string>& domains, Mode mode = Mode::Enforced);

    /// Built-in defaults plus a comma-separated operator list
    /// (e.g. the value of ALLOWED_IMAGE_DOMAINS).
    [[nodiscard]] static DomainAllowList with_defaults(std::string_view extra_csv = {},
                                                       Mode mode = Mode::Enforced);

    [[nodiscard]] bool allows(std::string_view host) const;

    [[nodiscard]] bool is_enforced() const noexcept { return mode_ == Mode::Enforced; }
    [[nodiscard]] Mode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::set<std::string>& domains() const noexcept { return domains_; }
    [[nodiscard]] std::size_t size() const noexcept { return domains_.size(); }

private:
    std::set<std::string> domains_;
    Mode mode_;
};

/// Split "a.com, b.com,,c.com" into {"a.com", "b.com", "c.com"}.
[[nodiscard]] std::vector<std::string> split_domain_list(std::string_view csv);

/// Normalised form of an allow-list entry or host, or empty if malformed.
[[nodiscard]] std::string normalize_domain(std::string_view domain);

}  // namespace ingress::security

#endif  // INGRESS_SECURITY_DOMAIN_ALLOW_LIST_HPP
