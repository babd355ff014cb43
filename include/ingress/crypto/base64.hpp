#ifndef INGRESS_CRYPTO_BASE64_HPP
#define INGRESS_CRYPTO_BASE64_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ingress::crypto {

/// RFC 4648 section 5 ("-" and "_"), padded with "=".
[[nodiscard]] std::string base64url_encode(std::span<const std::uint8_t> data);

/// Accepts padded or unpadded input. nullopt on any character outside the
/// urlsafe alphabet or an impossible length.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64url_decode(std::string_view encoded);

}  // namespace ingress::crypto

#endif  // INGRESS_CRYPTO_BASE64_HPP
