#ifndef INGRESS_UPLOAD_FILE_VALIDATION_ERROR_HPP
#define INGRESS_UPLOAD_FILE_VALIDATION_ERROR_HPP

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace ingress::upload {

// ─────────────────────────────────────────────────────────────────────────────
// File Validation Error
// ─────────────────────────────────────────────────────────────────────────────

struct FileValidationError {
    enum class Code {
        FilenameInvalid,       // Traversal, separators, control chars, blank, too long
        ExtensionNotAllowed,   // Extension outside the allowed set
        FileTooLarge,          // Content exceeds the size ceiling
        ContentSignature       // Leading bytes do not match the claimed type
    };

    Code code;
    std::string message;
    std::optional<std::uint64_t> actual_bytes;   // FileTooLarge only
    std::optional<std::uint64_t> max_bytes;      // FileTooLarge only

    [[nodiscard]] static FileValidationError filename_invalid(std::string msg) {
        return {Code::FilenameInvalid, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static FileValidationError extension_not_allowed(std::string msg) {
        return {Code::ExtensionNotAllowed, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static FileValidationError file_too_large(std::uint64_t actual, std::uint64_t max) {
        constexpr double kMiB = 1024.0 * 1024.0;
        return {Code::FileTooLarge,
                std::format("File is {:.2f} MB, maximum allowed is {:.2f} MB",
                            static_cast<double>(actual) / kMiB, static_cast<double>(max) / kMiB),
                actual, max};
    }

    [[nodiscard]] static FileValidationError content_signature(std::string msg) {
        return {Code::ContentSignature, std::move(msg), std::nullopt, std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(FileValidationError::Code code) noexcept {
    switch (code) {
        case FileValidationError::Code::FilenameInvalid:     return "FilenameInvalid";
        case FileValidationError::Code::ExtensionNotAllowed: return "ExtensionNotAllowed";
        case FileValidationError::Code::FileTooLarge:        return "FileTooLarge";
        case FileValidationError::Code::ContentSignature:    return "ContentSignature";
    }
    return "Unknown";
}

}  // namespace ingress::upload

#endif  // INGRESS_UPLOAD_FILE_VALIDATION_ERROR_HPP
