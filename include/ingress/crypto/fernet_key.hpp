#ifndef INGRESS_CRYPTO_FERNET_KEY_HPP
#define INGRESS_CRYPTO_FERNET_KEY_HPP

#include "ingress/crypto/crypto_error.hpp"

#include <tl/expected.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ingress::crypto {

// ═══════════════════════════════════════════════════════════════════════════
// FernetKey
// ═══════════════════════════════════════════════════════════════════════════
// 32 bytes: the first 16 sign (HMAC-SHA256), the last 16 encrypt (AES-128).
// Move-only; the bytes are wiped with OPENSSL_cleanse when the key is
// destroyed or moved from. Never log or serialise a key except through
// to_base64() for an operator who asked for one.

class FernetKey {
public:
    static constexpr std::size_t kSize = 32;

    /// Parse an operator-supplied urlsafe-base64 key.
    [[nodiscard]] static tl::expected<FernetKey, CryptoError> from_base64(std::string_view encoded);

    /// SHA-256 of a stable host identifier. Development fallback only: anyone
    /// who can read the identifier can derive the key.
    [[nodiscard]] static tl::expected<FernetKey, CryptoError> derive_from_host_id(std::string_view host_id);

    /// Fresh key from the OpenSSL CSPRNG.
    [[nodiscard]] static tl::expected<FernetKey, CryptoError> generate();

    ~FernetKey();
    FernetKey(FernetKey&& other) noexcept;
    FernetKey& operator=(FernetKey&& other) noexcept;
    FernetKey(const FernetKey&) = delete;
    FernetKey& operator=(const FernetKey&) = delete;

    [[nodiscard]] std::span<const std::uint8_t, 16> signing_key() const noexcept {
        return std::span<const std::uint8_t, 16>(bytes_.data(), 16);
    }
    [[nodiscard]] std::span<const std::uint8_t, 16> encryption_key() const noexcept {
        return std::span<const std::uint8_t, 16>(bytes_.data() + 16, 16);
    }

    [[nodiscard]] std::string to_base64() const;

private:
    FernetKey() = default;

    std::array<std::uint8_t, kSize> bytes_{};
};

}  // namespace ingress::crypto

#endif  // INGRESS_CRYPTO_FERNET_KEY_HPP
