#include "ingress/config/secure_config_store.hpp"
#include "ingress/log/logger.hpp"

namespace ingress::config {

namespace {

constexpr std::string_view kComponent = "config";

// What a fresh installation reports before anything has been saved.
const std::map<std::string, std::string>& stock_defaults() {
    static const std::map<std::string, std::string> defaults = {
        {"default_ai_model", "gpt-4"},
        {"openai_api_key", ""},
        {"claude_api_key", ""},
        {"preset_tags", R"(["商业思维","科技趋势","生活方式","创业故事","个人成长","情感励志"])"},
    };
    return defaults;
}

[[nodiscard]] std::string display_value(std::string_view key, const std::string& stored) {
    if (is_sensitive_key(key)) {
        return stored.empty() ? std::string{} : std::string(kRedactedPlaceholder);
    }
    return stored;
}

}  // namespace

SecureConfigStore::SecureConfigStore(const crypto::CredentialCipher& cipher, IConfigRepository& repository)
    : cipher_(cipher)
    , repository_(repository)
{}

// ─────────────────────────────────────────────────────────────────────────────
// Writes
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::string, ConfigStoreError> SecureConfigStore::prepare_value(
    std::string_view key, std::string_view value) const {
    if (!is_sensitive_key(key) || value.empty()) {
        return std::string(value);
    }

    auto token = cipher_.encrypt(value);
    if (!token) {
        get_logger().error_fmt(kComponent, "Encrypting '{}' failed: {}", key, token.error().message);
        return tl::unexpected(ConfigStoreError::storage_failed(
            std::string(key), "Encryption failed: " + token.error().message));
    }
    return std::move(*token);
}

tl::expected<void, ConfigStoreError> SecureConfigStore::set_config(std::string_view key, std::string_view value) {
    auto prepared = prepare_value(key, value);
    if (!prepared) {
        return tl::unexpected(std::move(prepared.error()));
    }

    auto stored = repository_.store(key, std::move(*prepared));
    if (stored) {
        get_logger().info_fmt(kComponent, "Config '{}' updated{}", key,
                              is_sensitive_key(key) && !value.empty() ? " (encrypted)" : "");
    }
    return stored;
}

tl::expected<void, ConfigStoreError> SecureConfigStore::set_configs(const std::map<std::string, std::string>& values) {
    std::map<std::string, std::string> prepared;
    for (const auto& [key, value] : values) {
        auto stored_form = prepare_value(key, value);
        if (!stored_form) {
            return tl::unexpected(std::move(stored_form.error()));
        }
        prepared.emplace(key, std::move(*stored_form));
    }

    auto stored = repository_.store_all(std::move(prepared));
    if (!stored) {
        get_logger().warn_fmt(kComponent, "Batch update of {} config value(s) rolled back: {}",
                              values.size(), stored.error().message);
        return stored;
    }
    get_logger().info_fmt(kComponent, "{} config value(s) updated", values.size());
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Reads
// ─────────────────────────────────────────────────────────────────────────────

std::string SecureConfigStore::get_config_value(std::string_view key) const {
    auto stored = repository_.load(key);
    if (!stored || stored->empty()) {
        return {};
    }

    auto plaintext = cipher_.decrypt(*stored);
    if (!plaintext) {
        // Legacy plaintext row, or a token from a different key.
        get_logger().debug(kComponent, "Stored value did not decrypt; returning it unchanged");
        return *stored;
    }
    return std::move(*plaintext);
}

tl::expected<std::string, ConfigStoreError> SecureConfigStore::read_config_value(std::string_view key) const {
    auto stored = repository_.load(key);
    if (!stored || stored->empty()) {
        return std::string{};
    }

    auto plaintext = cipher_.decrypt(*stored);
    if (plaintext) {
        return std::move(*plaintext);
    }
    if (crypto::CredentialCipher::looks_like_token(*stored)) {
        get_logger().error_fmt(kComponent,
            "Config '{}' holds an encrypted value that does not decrypt with the current key", key);
        return tl::unexpected(ConfigStoreError::decryption_failed(
            std::string(key), "Value is encrypted with a different key or has been tampered with"));
    }
    return *stored;
}

std::string SecureConfigStore::get_config_for_display(std::string_view key) const {
    auto stored = repository_.load(key);
    return display_value(key, stored.value_or(std::string{}));
}

nlohmann::json SecureConfigStore::get_all_for_display() const {
    auto rows = repository_.load_all();
    if (rows.empty()) {
        rows = stock_defaults();
    }

    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, stored] : rows) {
        out[key] = display_value(key, stored);
    }
    return out;
}

}  // namespace ingress::config
