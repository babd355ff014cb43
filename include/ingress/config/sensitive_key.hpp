#ifndef INGRESS_CONFIG_SENSITIVE_KEY_HPP
#define INGRESS_CONFIG_SENSITIVE_KEY_HPP

#include <array>
#include <optional>
#include <string_view>

namespace ingress::config {

// Configuration keys whose values are credentials. Closed set: adding a
// provider means adding an enumerator here.
enum class SensitiveKey {
    OpenAiApiKey,
    DeepSeekApiKey,
    ClaudeApiKey,
    AnthropicApiKey,
    GeminiApiKey
};

inline constexpr std::array<SensitiveKey, 5> kAllSensitiveKeys = {
    SensitiveKey::OpenAiApiKey,
    SensitiveKey::DeepSeekApiKey,
    SensitiveKey::ClaudeApiKey,
    SensitiveKey::AnthropicApiKey,
    SensitiveKey::GeminiApiKey,
};

[[nodiscard]] constexpr std::string_view to_string(SensitiveKey key) noexcept {
    switch (key) {
        case SensitiveKey::OpenAiApiKey:    return "openai_api_key";
        case SensitiveKey::DeepSeekApiKey:  return "deepseek_api_key";
        case SensitiveKey::ClaudeApiKey:    return "claude_api_key";
        case SensitiveKey::AnthropicApiKey: return "anthropic_api_key";
        case SensitiveKey::GeminiApiKey:    return "gemini_api_key";
    }
    return "unknown";
}

/// Case-insensitive lookup; nullopt for ordinary keys.
[[nodiscard]] std::optional<SensitiveKey> parse_sensitive_key(std::string_view key) noexcept;

[[nodiscard]] inline bool is_sensitive_key(std::string_view key) noexcept {
    return parse_sensitive_key(key).has_value();
}

}  // namespace ingress::config

#endif  // INGRESS_CONFIG_SENSITIVE_KEY_HPP
