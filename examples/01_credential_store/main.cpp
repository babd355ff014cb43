// Example 01: Encrypted Credential Store
//
// Saves an API key through SecureConfigStore, reads it back, and shows what a
// settings page would display. The key comes from ENCRYPTION_KEY when set,
// otherwise it is derived from this machine.

#include <ingress/config/secure_config_store.hpp>
#include <ingress/crypto/credential_cipher.hpp>
#include <ingress/log/redaction.hpp>
#include <ingress/log/spdlog_logger.hpp>
#include <ingress/settings.hpp>

#include <iostream>
#include <memory>

using namespace ingress;

int main() {
    std::cout << "=== Encrypted Credential Store Example ===\n\n";

    // 1. Settings and logging
    const auto settings = IngressSettings::from_environment();
    set_logger(std::make_unique<RedactingLogger>(make_spdlog_console_logger(settings.log_level)));

    // 2. Key and cipher
    auto key = crypto::load_encryption_key(settings);
    if (!key) {
        std::cerr << "ERROR: " << key.error().message << "\n";
        return 1;
    }
    const crypto::CredentialCipher cipher(std::move(*key));

    // 3. Store backed by an in-memory repository
    config::InMemoryConfigRepository repository;
    config::SecureConfigStore store(cipher, repository);

    auto saved = store.set_configs({
        {"openai_api_key", "sk-example-0000000000000000"},
        {"default_ai_model", "gpt-4"},
    });
    if (!saved) {
        std::cerr << "ERROR: " << saved.error().message << "\n";
        return 1;
    }

    // 4. What is at rest, what the caller gets, what the UI shows
    std::cout << "Stored at rest:   " << repository.load("openai_api_key").value_or("") << "\n";
    std::cout << "Read back:        " << store.get_config_value("openai_api_key") << "\n";
    std::cout << "Displayed:        " << store.get_config_for_display("openai_api_key") << "\n\n";
    std::cout << "All settings for display:\n" << store.get_all_for_display().dump(2) << "\n";

    return 0;
}
