#include "ingress/crypto/fernet_key.hpp"
#include "ingress/crypto/base64.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>

namespace ingress::crypto {

tl::expected<FernetKey, CryptoError> FernetKey::from_base64(std::string_view encoded) {
    auto decoded = base64url_decode(encoded);
    if (!decoded) {
        return tl::unexpected(CryptoError::invalid_key("Encryption key is not valid urlsafe base64"));
    }
    if (decoded->size() != kSize) {
        const auto size = decoded->size();
        OPENSSL_cleanse(decoded->data(), decoded->size());
        return tl::unexpected(CryptoError::invalid_key(
            "Encryption key must decode to 32 bytes, got " + std::to_string(size)));
    }

    FernetKey key;
    std::copy(decoded->begin(), decoded->end(), key.bytes_.begin());
    OPENSSL_cleanse(decoded->data(), decoded->size());
    return key;
}

tl::expected<FernetKey, CryptoError> FernetKey::derive_from_host_id(std::string_view host_id) {
    FernetKey key;
    unsigned int length = 0;
    if (EVP_Digest(host_id.data(), host_id.size(), key.bytes_.data(), &length, EVP_sha256(), nullptr) != 1 ||
        length != kSize) {
        return tl::unexpected(CryptoError::internal("SHA-256 of host identifier failed"));
    }
    return key;
}

tl::expected<FernetKey, CryptoError> FernetKey::generate() {
    FernetKey key;
    if (RAND_bytes(key.bytes_.data(), static_cast<int>(key.bytes_.size())) != 1) {
        return tl::unexpected(CryptoError::internal("RAND_bytes failed"));
    }
    return key;
}

FernetKey::~FernetKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

FernetKey::FernetKey(FernetKey&& other) noexcept
    : bytes_(other.bytes_)
{
    OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
}

FernetKey& FernetKey::operator=(FernetKey&& other) noexcept {
    if (this != &other) {
        bytes_ = other.bytes_;
        OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
    }
    return *this;
}

std::string FernetKey::to_base64() const {
    return base64url_encode(bytes_);
}

}  // namespace ingress::crypto
