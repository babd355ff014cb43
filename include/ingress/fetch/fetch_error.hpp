#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ingress::fetch {

struct FetchError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        HttpStatus,    // Non-2xx response
        NotAnImage,    // Content-Type is not image/*
        TooLarge       // Body exceeded the size limit
    };

    Code code;
    std::string message;
    std::optional<int> status_code;

    static FetchError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt};
    }
    static FetchError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt};
    }
    static FetchError http_status(int status) {
        return {Code::HttpStatus, "Server answered HTTP " + std::to_string(status), status};
    }
    static FetchError not_an_image(const std::string& content_type) {
        return {Code::NotAnImage,
                "URL is not an image (Content-Type: " + (content_type.empty() ? "none" : content_type) + ")",
                std::nullopt};
    }
    static FetchError too_large(std::size_t limit_bytes) {
        return {Code::TooLarge,
                "Response exceeds the " + std::to_string(limit_bytes / (1024 * 1024)) + " MB limit",
                std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(FetchError::Code code) noexcept {
    switch (code) {
        case FetchError::Code::ConnectionFailed: return "ConnectionFailed";
        case FetchError::Code::Timeout:          return "Timeout";
        case FetchError::Code::HttpStatus:       return "HttpStatus";
        case FetchError::Code::NotAnImage:       return "NotAnImage";
        case FetchError::Code::TooLarge:         return "TooLarge";
    }
    return "Unknown";
}

}  // namespace ingress::fetch
