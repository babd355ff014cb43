#ifndef INGRESS_CONFIG_SECURE_CONFIG_STORE_HPP
#define INGRESS_CONFIG_SECURE_CONFIG_STORE_HPP

#include "ingress/config/config_repository.hpp"
#include "ingress/config/config_store_error.hpp"
#include "ingress/config/sensitive_key.hpp"
#include "ingress/crypto/credential_cipher.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <map>
#include <string>
#include <string_view>

namespace ingress::config {

/// Shown instead of a sensitive value that is set.
inline constexpr std::string_view kRedactedPlaceholder = "********";

// ═══════════════════════════════════════════════════════════════════════════
// SecureConfigStore
// ═══════════════════════════════════════════════════════════════════════════
// Configuration reads and writes with encryption at rest for SensitiveKey
// values.
//
//   set_config              encrypts sensitive, non-empty values
//   get_config_value        trusted read: decrypted value, or the stored value
//                           unchanged when it does not decrypt (rows written
//                           before encryption was introduced)
//   get_config_for_display  untrusted read: sensitive values become
//                           kRedactedPlaceholder, never any part of the secret
//   read_config_value       strict trusted read that reports a token this key
//                           cannot open instead of handing back ciphertext
//
// Neither the cipher nor the repository is owned; both must outlive the store.

class SecureConfigStore {
public:
    SecureConfigStore(const crypto::CredentialCipher& cipher, IConfigRepository& repository);

    [[nodiscard]] tl::expected<void, ConfigStoreError> set_config(std::string_view key, std::string_view value);

    /// Apply several updates as one write: either every value is stored or
    /// none is.
    [[nodiscard]] tl::expected<void, ConfigStoreError> set_configs(const std::map<std::string, std::string>& values);

    /// Empty string when unset.
    [[nodiscard]] std::string get_config_value(std::string_view key) const;

    [[nodiscard]] tl::expected<std::string, ConfigStoreError> read_config_value(std::string_view key) const;

    [[nodiscard]] std::string get_config_for_display(std::string_view key) const;

    /// Every row as display values. An empty repository reports the stock
    /// defaults a fresh installation starts from.
    [[nodiscard]] nlohmann::json get_all_for_display() const;

private:
    /// The form a value takes at rest: a token for non-empty sensitive values.
    [[nodiscard]] tl::expected<std::string, ConfigStoreError> prepare_value(
        std::string_view key, std::string_view value) const;

    const crypto::CredentialCipher& cipher_;
    IConfigRepository& repository_;
};

}  // namespace ingress::config

#endif  // INGRESS_CONFIG_SECURE_CONFIG_STORE_HPP
