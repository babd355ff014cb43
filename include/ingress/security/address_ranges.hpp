#ifndef INGRESS_SECURITY_ADDRESS_RANGES_HPP
#define INGRESS_SECURITY_ADDRESS_RANGES_HPP

#include <asio/ip/address.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ingress::security {

// ═══════════════════════════════════════════════════════════════════════════
// Reserved Address Ranges
// ═══════════════════════════════════════════════════════════════════════════
// Destinations the server must never be tricked into contacting. The table is
// compiled in; there is no runtime way to add or remove a range.
//
// IPv4-mapped IPv6 addresses (::ffff:a.b.c.d) are judged by the embedded IPv4
// address, so ::ffff:127.0.0.1 is loopback.

struct Ipv4Range {
    std::uint32_t network;      // Host byte order
    std::uint8_t prefix_length;
    std::string_view label;
};

struct Ipv6Range {
    std::array<std::uint8_t, 16> network;
    std::uint8_t prefix_length;
    std::string_view label;
};

inline constexpr std::array<Ipv4Range, 6> kReservedIpv4Ranges = {{
    {0x0A000000u,  8, "10.0.0.0/8"},       // RFC 1918
    {0xAC100000u, 12, "172.16.0.0/12"},    // RFC 1918
    {0xC0A80000u, 16, "192.168.0.0/16"},   // RFC 1918
    {0x7F000000u,  8, "127.0.0.0/8"},      // Loopback
    {0xA9FE0000u, 16, "169.254.0.0/16"},   // Link-local, cloud metadata
    {0x00000000u,  8, "0.0.0.0/8"},        // "This network", reaches localhost on Linux
}};

inline constexpr std::array<Ipv6Range, 4> kReservedIpv6Ranges = {{
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}, 128, "::1/128"},
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}, 128, "::/128"},
    {{0xfc, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}, 7, "fc00::/7"},
    {{0xfe, 0x80, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}, 10, "fe80::/10"},
}};

/// Label of the reserved range containing `address` ("10.0.0.0/8", ...),
/// or nullopt for a routable address.
[[nodiscard]] std::optional<std::string_view> reserved_range_of(const asio::ip::address& address) noexcept;

[[nodiscard]] inline bool is_reserved_address(const asio::ip::address& address) noexcept {
    return reserved_range_of(address).has_value();
}

/// Parse a URL host as an IP literal. Accepts dotted-quad IPv4 and IPv6 with
/// or without surrounding brackets. Returns nullopt for hostnames.
[[nodiscard]] std::optional<asio::ip::address> parse_ip_literal(std::string_view host);

}  // namespace ingress::security

#endif  // INGRESS_SECURITY_ADDRESS_RANGES_HPP
