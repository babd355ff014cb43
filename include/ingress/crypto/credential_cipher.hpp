#ifndef INGRESS_CRYPTO_CREDENTIAL_CIPHER_HPP
#define INGRESS_CRYPTO_CREDENTIAL_CIPHER_HPP

#include "ingress/crypto/crypto_error.hpp"
#include "ingress/crypto/fernet_key.hpp"

#include <tl/expected.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ingress {
struct IngressSettings;
}

namespace ingress::crypto {

// ═══════════════════════════════════════════════════════════════════════════
// CredentialCipher
// ═══════════════════════════════════════════════════════════════════════════
// Authenticated symmetric encryption for stored secrets, in the Fernet token
// format:
//
//   0x80 | timestamp (u64 BE) | IV (16) | AES-128-CBC(PKCS7) | HMAC-SHA256 (32)
//
// urlsafe-base64 encoded. Tokens written by any other Fernet implementation
// with the same key decrypt here and vice versa.
//
// The cipher is the only holder of the key. It is immutable after
// construction; every call builds its own OpenSSL contexts, so one instance
// can be shared across threads.

class CredentialCipher {
public:
    static constexpr std::uint8_t kVersion = 0x80;
    static constexpr std::size_t kIvSize = 16;
    static constexpr std::size_t kHmacSize = 32;
    static constexpr std::size_t kHeaderSize = 1 + 8 + kIvSize;
    static constexpr std::size_t kMinTokenBytes = kHeaderSize + 16 + kHmacSize;

    // Tokens stamped further than this in the future are rejected when a TTL
    // is enforced.
    static constexpr std::chrono::seconds kMaxClockSkew{60};

    explicit CredentialCipher(FernetKey key);

    /// Encrypt with a random IV and the current time. Empty input gives an
    /// empty string (nothing to protect).
    [[nodiscard]] tl::expected<std::string, CryptoError> encrypt(std::string_view plaintext) const;

    /// Deterministic form for known-answer tests.
    [[nodiscard]] tl::expected<std::string, CryptoError> encrypt_at(
        std::string_view plaintext,
        std::uint64_t unix_seconds,
        const std::array<std::uint8_t, kIvSize>& iv
    ) const;

    /// Verify and decrypt. With a TTL, tokens older than `ttl` are Expired.
    [[nodiscard]] tl::expected<std::string, CryptoError> decrypt(
        std::string_view token,
        std::optional<std::chrono::seconds> ttl = std::nullopt
    ) const;

    /// True if `value` authenticates under this key.
    [[nodiscard]] bool is_encrypted(std::string_view value) const;

    /// True if `value` has the shape of a Fernet token (alphabet, version
    /// byte, length), whatever key produced it.
    [[nodiscard]] static bool looks_like_token(std::string_view value);

private:
    [[nodiscard]] tl::expected<std::string, CryptoError> decrypt_at(
        std::string_view token,
        std::optional<std::chrono::seconds> ttl,
        std::uint64_t now
    ) const;

    FernetKey key_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Key management
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr std::string_view kDevelopmentHostId = "contenthub-dev-machine";

/// Stable identifier of this host: contents of `machine_id_path` (trimmed),
/// else the hostname, else kDevelopmentHostId.
[[nodiscard]] std::string read_host_identifier(
    const std::filesystem::path& machine_id_path = "/etc/machine-id");

/// The explicit key from settings if present (malformed -> InvalidKey, never
/// replaced), otherwise a key derived from the host identifier, with a
/// warning that values encrypted with it only decrypt on this host.
[[nodiscard]] tl::expected<FernetKey, CryptoError> load_encryption_key(const IngressSettings& settings);

/// Fresh random key in the urlsafe-base64 form ENCRYPTION_KEY expects.
[[nodiscard]] tl::expected<std::string, CryptoError> generate_key();

}  // namespace ingress::crypto

#endif  // INGRESS_CRYPTO_CREDENTIAL_CIPHER_HPP
