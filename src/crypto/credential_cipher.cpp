#include "ingress/crypto/credential_cipher.hpp"
#include "ingress/crypto/base64.hpp"
#include "ingress/log/logger.hpp"
#include "ingress/settings.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

namespace ingress::crypto {

namespace {

constexpr std::string_view kComponent = "crypto";

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[nodiscard]] CipherCtxPtr make_cipher_ctx() {
    return CipherCtxPtr(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

[[nodiscard]] std::uint64_t unix_now() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// Wipes a buffer that held plaintext or key-derived bytes.
struct ScopedCleanse {
    std::vector<std::uint8_t>& buffer;
    ~ScopedCleanse() { OPENSSL_cleanse(buffer.data(), buffer.size()); }
};

[[nodiscard]] bool hmac_sha256(
    std::span<const std::uint8_t, 16> key,
    const std::uint8_t* data,
    std::size_t size,
    std::array<std::uint8_t, CredentialCipher::kHmacSize>& out
) {
    unsigned int length = 0;
    const auto* result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                              data, size, out.data(), &length);
    return result != nullptr && length == out.size();
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

}  // namespace

CredentialCipher::CredentialCipher(FernetKey key)
    : key_(std::move(key))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Encryption
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::string, CryptoError> CredentialCipher::encrypt(std::string_view plaintext) const {
    if (plaintext.empty()) {
        return std::string{};
    }
    std::array<std::uint8_t, kIvSize> iv{};
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        return tl::unexpected(CryptoError::internal("RAND_bytes failed"));
    }
    return encrypt_at(plaintext, unix_now(), iv);
}

tl::expected<std::string, CryptoError> CredentialCipher::encrypt_at(
    std::string_view plaintext,
    std::uint64_t unix_seconds,
    const std::array<std::uint8_t, kIvSize>& iv
) const {
    auto ctx = make_cipher_ctx();
    if (!ctx) {
        return tl::unexpected(CryptoError::internal("EVP_CIPHER_CTX_new failed"));
    }

    std::vector<std::uint8_t> token(kHeaderSize + plaintext.size() + 16 + kHmacSize);
    token[0] = kVersion;
    for (int i = 0; i < 8; ++i) {
        token[1 + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(unix_seconds >> (56 - 8 * i));
    }
    std::copy(iv.begin(), iv.end(), token.begin() + 9);

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           key_.encryption_key().data(), iv.data()) != 1) {
        return tl::unexpected(CryptoError::internal("EVP_EncryptInit_ex failed"));
    }

    int update_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), token.data() + kHeaderSize, &update_len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return tl::unexpected(CryptoError::internal("EVP_EncryptUpdate failed"));
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), token.data() + kHeaderSize + update_len, &final_len) != 1) {
        return tl::unexpected(CryptoError::internal("EVP_EncryptFinal_ex failed"));
    }

    const std::size_t signed_size = kHeaderSize + static_cast<std::size_t>(update_len + final_len);
    std::array<std::uint8_t, kHmacSize> mac{};
    if (!hmac_sha256(key_.signing_key(), token.data(), signed_size, mac)) {
        return tl::unexpected(CryptoError::internal("HMAC-SHA256 failed"));
    }
    std::copy(mac.begin(), mac.end(), token.begin() + static_cast<std::ptrdiff_t>(signed_size));
    token.resize(signed_size + kHmacSize);

    return base64url_encode(token);
}

// ─────────────────────────────────────────────────────────────────────────────
// Decryption
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::string, CryptoError> CredentialCipher::decrypt(
    std::string_view token,
    std::optional<std::chrono::seconds> ttl
) const {
    return decrypt_at(token, ttl, unix_now());
}

tl::expected<std::string, CryptoError> CredentialCipher::decrypt_at(
    std::string_view token,
    std::optional<std::chrono::seconds> ttl,
    std::uint64_t now
) const {
    if (token.empty()) {
        return std::string{};
    }

    const auto data = base64url_decode(token);
    if (!data) {
        return tl::unexpected(CryptoError::invalid_token("Token is not valid urlsafe base64"));
    }
    if (data->size() < kMinTokenBytes || (*data)[0] != kVersion ||
        (data->size() - kHeaderSize - kHmacSize) % 16 != 0) {
        return tl::unexpected(CryptoError::invalid_token("Token has an invalid structure"));
    }

    // Authenticate before touching the ciphertext.
    const std::size_t signed_size = data->size() - kHmacSize;
    std::array<std::uint8_t, kHmacSize> expected{};
    if (!hmac_sha256(key_.signing_key(), data->data(), signed_size, expected)) {
        return tl::unexpected(CryptoError::internal("HMAC-SHA256 failed"));
    }
    if (CRYPTO_memcmp(expected.data(), data->data() + signed_size, kHmacSize) != 0) {
        return tl::unexpected(CryptoError::invalid_token("Token signature does not match"));
    }

    std::uint64_t timestamp = 0;
    for (std::size_t i = 1; i <= 8; ++i) {
        timestamp = (timestamp << 8) | (*data)[i];
    }
    if (ttl) {
        const auto ttl_seconds = static_cast<std::uint64_t>(ttl->count());
        if (timestamp + ttl_seconds < now) {
            return tl::unexpected(CryptoError::expired("Token is older than the allowed lifetime"));
        }
        if (now + static_cast<std::uint64_t>(kMaxClockSkew.count()) < timestamp) {
            return tl::unexpected(CryptoError::invalid_token("Token timestamp is in the future"));
        }
    }

    auto ctx = make_cipher_ctx();
    if (!ctx) {
        return tl::unexpected(CryptoError::internal("EVP_CIPHER_CTX_new failed"));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           key_.encryption_key().data(), data->data() + 9) != 1) {
        return tl::unexpected(CryptoError::internal("EVP_DecryptInit_ex failed"));
    }

    const std::size_t ciphertext_size = signed_size - kHeaderSize;
    std::vector<std::uint8_t> plaintext(ciphertext_size + 16);
    ScopedCleanse wipe{plaintext};

    int update_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &update_len,
                          data->data() + kHeaderSize, static_cast<int>(ciphertext_size)) != 1) {
        return tl::unexpected(CryptoError::invalid_token("Token ciphertext could not be decrypted"));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + update_len, &final_len) != 1) {
        return tl::unexpected(CryptoError::invalid_token("Token padding is invalid"));
    }

    return std::string(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<std::size_t>(update_len + final_len));
}

bool CredentialCipher::is_encrypted(std::string_view value) const {
    if (value.empty()) {
        return false;
    }
    return decrypt(value).has_value();
}

bool CredentialCipher::looks_like_token(std::string_view value) {
    if (value.empty()) {
        return false;
    }
    const auto data = base64url_decode(value);
    return data && data->size() >= kMinTokenBytes && (*data)[0] == kVersion &&
           (data->size() - kHeaderSize - kHmacSize) % 16 == 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// Key management
// ─────────────────────────────────────────────────────────────────────────────

std::string read_host_identifier(const std::filesystem::path& machine_id_path) {
    std::ifstream file(machine_id_path);
    if (file) {
        std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        const auto id = trim(contents);
        if (!id.empty()) {
            return std::string(id);
        }
    }

    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return hostname;
    }

    return std::string(kDevelopmentHostId);
}

tl::expected<FernetKey, CryptoError> load_encryption_key(const IngressSettings& settings) {
    if (settings.encryption_key) {
        auto key = FernetKey::from_base64(trim(*settings.encryption_key));
        if (!key) {
            get_logger().error_fmt(kComponent, "Configured encryption key rejected: {}", key.error().message);
            return key;
        }
        get_logger().info(kComponent, "Using encryption key from configuration");
        return key;
    }

    get_logger().warn(kComponent,
        "No ENCRYPTION_KEY configured; deriving a key from the host identifier. "
        "Values encrypted with it can only be decrypted on this machine. "
        "Set ENCRYPTION_KEY in production.");
    return FernetKey::derive_from_host_id(read_host_identifier(settings.machine_id_path));
}

tl::expected<std::string, CryptoError> generate_key() {
    auto key = FernetKey::generate();
    if (!key) {
        return tl::unexpected(key.error());
    }
    return key->to_base64();
}

}  // namespace ingress::crypto
