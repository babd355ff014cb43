#include "ingress/crypto/base64.hpp"

#include <openssl/evp.h>

#include <algorithm>

namespace ingress::crypto {

namespace {

[[nodiscard]] bool is_urlsafe_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}

}  // namespace

std::string base64url_encode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()), data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));

    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::optional<std::vector<std::uint8_t>> base64url_decode(std::string_view encoded) {
    std::size_t padding = 0;
    while (!encoded.empty() && encoded.back() == '=' && padding < 2) {
        encoded.remove_suffix(1);
        ++padding;
    }
    if (encoded.empty()) {
        return padding == 0 ? std::optional<std::vector<std::uint8_t>>(std::vector<std::uint8_t>{})
                            : std::nullopt;
    }
    if (!std::all_of(encoded.begin(), encoded.end(), is_urlsafe_char)) {
        return std::nullopt;
    }
    if (encoded.size() % 4 == 1) {
        return std::nullopt;
    }

    // EVP_DecodeBlock wants the standard alphabet with full padding.
    const std::size_t needed = (4 - encoded.size() % 4) % 4;
    if (padding != 0 && padding != needed) {
        return std::nullopt;
    }
    std::string standard(encoded);
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');
    standard.append(needed, '=');

    std::vector<std::uint8_t> out(standard.size() / 4 * 3);
    const int written = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
        static_cast<int>(standard.size()));
    if (written < 0 || static_cast<std::size_t>(written) < needed) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by "=" padding.
    out.resize(static_cast<std::size_t>(written) - needed);
    return out;
}

}  // namespace ingress::crypto
