#ifndef INGRESS_CRYPTO_CRYPTO_ERROR_HPP
#define INGRESS_CRYPTO_CRYPTO_ERROR_HPP

#include <string>
#include <string_view>

namespace ingress::crypto {

// ─────────────────────────────────────────────────────────────────────────────
// Crypto Error
// ─────────────────────────────────────────────────────────────────────────────
// Messages never include key material, plaintext or the token itself.

struct CryptoError {
    enum class Code {
        InvalidKey,     // Key is not 32 bytes of urlsafe base64
        InvalidToken,   // Malformed token or authentication failure
        Expired,        // Token older than the requested TTL
        Internal        // OpenSSL failure
    };

    Code code;
    std::string message;

    [[nodiscard]] static CryptoError invalid_key(std::string msg) {
        return {Code::InvalidKey, std::move(msg)};
    }
    [[nodiscard]] static CryptoError invalid_token(std::string msg) {
        return {Code::InvalidToken, std::move(msg)};
    }
    [[nodiscard]] static CryptoError expired(std::string msg) {
        return {Code::Expired, std::move(msg)};
    }
    [[nodiscard]] static CryptoError internal(std::string msg) {
        return {Code::Internal, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(CryptoError::Code code) noexcept {
    switch (code) {
        case CryptoError::Code::InvalidKey:   return "InvalidKey";
        case CryptoError::Code::InvalidToken: return "InvalidToken";
        case CryptoError::Code::Expired:      return "Expired";
        case CryptoError::Code::Internal:     return "Internal";
    }
    return "Unknown";
}

}  // namespace ingress::crypto

#endif  // INGRESS_CRYPTO_CRYPTO_ERROR_HPP
