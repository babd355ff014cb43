#ifndef INGRESS_CONFIG_CONFIG_STORE_ERROR_HPP
#define INGRESS_CONFIG_CONFIG_STORE_ERROR_HPP

#include <string>
#include <string_view>

namespace ingress::config {

struct ConfigStoreError {
    enum class Code {
        DecryptionFailed,   // Stored value is a token this key cannot open
        StorageFailed       // Repository write or encryption failed
    };

    Code code;
    std::string key;
    std::string message;

    [[nodiscard]] static ConfigStoreError decryption_failed(std::string key, std::string msg) {
        return {Code::DecryptionFailed, std::move(key), std::move(msg)};
    }
    [[nodiscard]] static ConfigStoreError storage_failed(std::string key, std::string msg) {
        return {Code::StorageFailed, std::move(key), std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ConfigStoreError::Code code) noexcept {
    switch (code) {
        case ConfigStoreError::Code::DecryptionFailed: return "DecryptionFailed";
        case ConfigStoreError::Code::StorageFailed:    return "StorageFailed";
    }
    return "Unknown";
}

}  // namespace ingress::config

#endif  // INGRESS_CONFIG_CONFIG_STORE_ERROR_HPP
