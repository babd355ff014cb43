#include "ingress/security/address_ranges.hpp"

#include <string>

namespace ingress::security {

namespace {

[[nodiscard]] bool ipv4_in(std::uint32_t value, const Ipv4Range& range) noexcept {
    if (range.prefix_length == 0) return true;
    const std::uint32_t mask = range.prefix_length >= 32
        ? 0xFFFFFFFFu
        : ~(0xFFFFFFFFu >> range.prefix_length);
    return (value & mask) == (range.network & mask);
}

[[nodiscard]] bool ipv6_in(const std::array<std::uint8_t, 16>& bytes, const Ipv6Range& range) noexcept {
    std::size_t remaining = range.prefix_length;
    for (std::size_t i = 0; i < bytes.size() && remaining > 0; ++i) {
        const std::size_t bits = remaining >= 8 ? 8 : remaining;
        const auto mask = static_cast<std::uint8_t>(0xFFu << (8 - bits));
        if ((bytes[i] & mask) != (range.network[i] & mask)) {
            return false;
        }
        remaining -= bits;
    }
    return true;
}

[[nodiscard]] std::optional<std::string_view> reserved_v4(std::uint32_t value) noexcept {
    for (const auto& range : kReservedIpv4Ranges) {
        if (ipv4_in(value, range)) {
            return range.label;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string_view> reserved_range_of(const asio::ip::address& address) noexcept {
    if (address.is_v4()) {
        return reserved_v4(address.to_v4().to_uint());
    }

    const auto bytes = address.to_v6().to_bytes();

    // ::ffff:a.b.c.d carries an IPv4 destination; judge it as IPv4.
    if (address.to_v6().is_v4_mapped()) {
        const std::uint32_t embedded =
            (static_cast<std::uint32_t>(bytes[12]) << 24) |
            (static_cast<std::uint32_t>(bytes[13]) << 16) |
            (static_cast<std::uint32_t>(bytes[14]) << 8) |
            static_cast<std::uint32_t>(bytes[15]);
        return reserved_v4(embedded);
    }

    for (const auto& range : kReservedIpv6Ranges) {
        if (ipv6_in(bytes, range)) {
            return range.label;
        }
    }
    return std::nullopt;
}

std::optional<asio::ip::address> parse_ip_literal(std::string_view host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        return std::nullopt;
    }

    asio::error_code ec;
    const auto address = asio::ip::make_address(std::string(host), ec);
    if (ec) {
        return std::nullopt;
    }
    return address;
}

}  // namespace ingress::security
