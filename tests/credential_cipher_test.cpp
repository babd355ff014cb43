// ─────────────────────────────────────────────────────────────────────────────
// CredentialCipher Tests
// ─────────────────────────────────────────────────────────────────────────────
// Fernet token encryption, key parsing and host-bound key derivation.

#include <catch2/catch_test_macros.hpp>

#include "ingress/crypto/credential_cipher.hpp"
#include "ingress/settings.hpp"
#include "mocks/capturing_logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace ingress::crypto;
using ingress::IngressSettings;
using ingress::LogLevel;
using ingress::testing::ScopedCapture;

namespace {

// Published Fernet test vector
constexpr std::string_view kVectorKey = "cw_0x689RpI-jtRR7oE8h_eQsKImvJapLeSbXpwF4e4=";
constexpr std::string_view kVectorToken =
    "gAAAAAAdwJ6wAAECAwQFBgcICQoLDA0ODy021cpGVWKZ_eEwCGM4BLLF_5CV9dOPmrhuVUPgJobwOz7JcbmrR64jVmpU4IwqDA==";
constexpr std::uint64_t kVectorTimestamp = 499162800;
constexpr std::array<std::uint8_t, 16> kVectorIv = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15};

FernetKey vector_key() {
    auto key = FernetKey::from_base64(kVectorKey);
    REQUIRE(key.has_value());
    return std::move(*key);
}

FernetKey random_key() {
    auto key = FernetKey::generate();
    REQUIRE(key.has_value());
    return std::move(*key);
}

std::uint64_t now_seconds() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Token Format
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Deterministic encryption matches the Fernet test vector", "[crypto][fernet]") {
    const CredentialCipher cipher(vector_key());

    auto token = cipher.encrypt_at("hello", kVectorTimestamp, kVectorIv);

    REQUIRE(token.has_value());
    REQUIRE(*token == kVectorToken);
}

TEST_CASE("Test vector token decrypts", "[crypto][fernet]") {
    const CredentialCipher cipher(vector_key());

    auto plaintext = cipher.decrypt(kVectorToken);

    REQUIRE(plaintext.has_value());
    REQUIRE(*plaintext == "hello");
}

TEST_CASE("Encrypt then decrypt returns the plaintext", "[crypto][fernet]") {
    const CredentialCipher cipher(random_key());

    const std::vector<std::string> plaintexts = {
        "sk-proj-abc123", "0123456789abcdef", "密钥 🔑", std::string(1000, 'k'),
    };
    for (const auto& plaintext : plaintexts) {
        auto token = cipher.encrypt(plaintext);
        REQUIRE(token.has_value());
        REQUIRE(token->find(plaintext) == std::string::npos);
        REQUIRE(CredentialCipher::looks_like_token(*token));

        auto decrypted = cipher.decrypt(*token);
        REQUIRE(decrypted.has_value());
        REQUIRE(*decrypted == plaintext);
    }
}

TEST_CASE("Each encryption uses a fresh IV", "[crypto][fernet]") {
    const CredentialCipher cipher(random_key());

    auto a = cipher.encrypt("same secret");
    auto b = cipher.encrypt("same secret");

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a != *b);
}

TEST_CASE("Empty values pass through", "[crypto][fernet]") {
    const CredentialCipher cipher(random_key());

    REQUIRE(cipher.encrypt("") == std::string{});
    REQUIRE(cipher.decrypt("") == std::string{});
    REQUIRE_FALSE(cipher.is_encrypted(""));
}

// ═══════════════════════════════════════════════════════════════════════════
// Authentication
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Tampered token is rejected", "[crypto][fernet]") {
    const CredentialCipher cipher(vector_key());

    for (std::size_t pos : {std::size_t{5}, std::size_t{30}, std::size_t{60}}) {
        std::string token(kVectorToken);
        token[pos] = token[pos] == 'A' ? 'B' : 'A';

        auto result = cipher.decrypt(token);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == CryptoError::Code::InvalidToken);
    }
}

TEST_CASE("Token from another key is rejected", "[crypto][fernet]") {
    const CredentialCipher cipher(random_key());

    auto result = cipher.decrypt(kVectorToken);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == CryptoError::Code::InvalidToken);
    REQUIRE_FALSE(cipher.is_encrypted(kVectorToken));
    REQUIRE(CredentialCipher::looks_like_token(kVectorToken));
}

TEST_CASE("Malformed tokens are rejected", "[crypto][fernet]") {
    const CredentialCipher cipher(vector_key());

    for (std::string_view bad : {"not a token", "gAAAAA", "sk-abcdef0123456789", "AAAA=AAA"}) {
        auto result = cipher.decrypt(bad);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == CryptoError::Code::InvalidToken);
        REQUIRE_FALSE(CredentialCipher::looks_like_token(bad));
    }
}

TEST_CASE("Error messages never echo the token", "[crypto][fernet]") {
    const CredentialCipher cipher(random_key());

    auto result = cipher.decrypt(kVectorToken);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message.find(kVectorToken.substr(0, 20)) == std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// Time To Live
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Token older than the TTL is expired", "[crypto][fernet][ttl]") {
    const CredentialCipher cipher(vector_key());

    auto result = cipher.decrypt(kVectorToken, std::chrono::seconds(60));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == CryptoError::Code::Expired);
}

TEST_CASE("Token within the TTL decrypts", "[crypto][fernet][ttl]") {
    const CredentialCipher cipher(vector_key());
    auto token = cipher.encrypt_at("fresh", now_seconds() - 10, kVectorIv);
    REQUIRE(token.has_value());

    auto result = cipher.decrypt(*token, std::chrono::seconds(3600));

    REQUIRE(result.has_value());
    REQUIRE(*result == "fresh");
}

TEST_CASE("Token stamped far in the future is rejected under a TTL", "[crypto][fernet][ttl]") {
    const CredentialCipher cipher(vector_key());
    auto token = cipher.encrypt_at("later", now_seconds() + 3600, kVectorIv);
    REQUIRE(token.has_value());

    auto with_ttl = cipher.decrypt(*token, std::chrono::seconds(60));
    REQUIRE_FALSE(with_ttl.has_value());
    REQUIRE(with_ttl.error().code == CryptoError::Code::InvalidToken);

    // Without a TTL the timestamp is not checked
    REQUIRE(cipher.decrypt(*token) == std::string("later"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Keys
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Key parsing requires 32 urlsafe-base64 bytes", "[crypto][key]") {
    REQUIRE(FernetKey::from_base64(kVectorKey).has_value());
    REQUIRE(FernetKey::from_base64("cw_0x689RpI-jtRR7oE8h_eQsKImvJapLeSbXpwF4e4").has_value());

    for (std::string_view bad : {"", "AAAA", "not base64 at all!", "cw/0x689RpI+jtRR7oE8h/eQsKImvJapLeSbXpwF4e4="}) {
        auto key = FernetKey::from_base64(bad);
        REQUIRE_FALSE(key.has_value());
        REQUIRE(key.error().code == CryptoError::Code::InvalidKey);
    }
}

TEST_CASE("Key serialises back to its base64 form", "[crypto][key]") {
    REQUIRE(vector_key().to_base64() == kVectorKey);

    auto generated = random_key();
    auto reparsed = FernetKey::from_base64(generated.to_base64());
    REQUIRE(reparsed.has_value());
    REQUIRE(reparsed->to_base64() == generated.to_base64());
}

TEST_CASE("Key halves split signing from encryption", "[crypto][key]") {
    const auto key = vector_key();
    REQUIRE(key.signing_key()[0] == 0x73);
    REQUIRE(key.encryption_key().data() == key.signing_key().data() + 16);
}

TEST_CASE("Host-derived key is SHA-256 of the identifier", "[crypto][key]") {
    auto key = FernetKey::derive_from_host_id(kDevelopmentHostId);

    REQUIRE(key.has_value());
    REQUIRE(key->to_base64() == "zlHrGyuChodiQb6JbtZqtPzu3FYTdZibxlzB0OTdU_g=");
}

TEST_CASE("Host identifier comes from the machine-id file", "[crypto][key]") {
    const auto path = write_temp("ingress_machine_id", "  4c4c4544004a\n");
    REQUIRE(read_host_identifier(path) == "4c4c4544004a");
    std::filesystem::remove(path);

    SECTION("missing or blank file falls back to a non-empty identifier") {
        REQUIRE_FALSE(read_host_identifier("/nonexistent/machine-id").empty());

        const auto blank = write_temp("ingress_machine_id_blank", " \n");
        REQUIRE_FALSE(read_host_identifier(blank).empty());
        std::filesystem::remove(blank);
    }
}

TEST_CASE("Configured key is used as given", "[crypto][key]") {
    IngressSettings settings;
    settings.with_encryption_key(std::string(kVectorKey));

    auto key = load_encryption_key(settings);

    REQUIRE(key.has_value());
    REQUIRE(key->to_base64() == kVectorKey);
}

TEST_CASE("Malformed configured key is an error, never replaced", "[crypto][key]") {
    ScopedCapture capture;
    IngressSettings settings;
    settings.with_encryption_key("definitely-not-a-key");

    auto key = load_encryption_key(settings);

    REQUIRE_FALSE(key.has_value());
    REQUIRE(key.error().code == CryptoError::Code::InvalidKey);
    REQUIRE(capture->count(LogLevel::Error) == 1);
    REQUIRE_FALSE(capture->contains("definitely-not-a-key"));
}

TEST_CASE("Without a configured key one is derived from the host", "[crypto][key]") {
    ScopedCapture capture;
    const auto path = write_temp("ingress_machine_id_derive", "abc-host-123\n");
    IngressSettings settings;
    settings.machine_id_path = path;

    auto key = load_encryption_key(settings);
    auto expected = FernetKey::derive_from_host_id("abc-host-123");

    REQUIRE(key.has_value());
    REQUIRE(expected.has_value());
    REQUIRE(key->to_base64() == expected->to_base64());
    REQUIRE(capture->count(LogLevel::Warn) == 1);

    std::filesystem::remove(path);
}

TEST_CASE("Generated keys parse and differ", "[crypto][key]") {
    auto a = generate_key();
    auto b = generate_key();

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a != *b);
    REQUIRE(a->size() == 44);
    REQUIRE(FernetKey::from_base64(*a).has_value());
}
