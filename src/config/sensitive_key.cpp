#include "ingress/config/sensitive_key.hpp"

#include <cctype>

namespace ingress::config {

namespace {

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<SensitiveKey> parse_sensitive_key(std::string_view key) noexcept {
    for (const auto candidate : kAllSensitiveKeys) {
        if (iequals(key, to_string(candidate))) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace ingress::config
