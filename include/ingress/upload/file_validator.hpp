#ifndef INGRESS_UPLOAD_FILE_VALIDATOR_HPP
#define INGRESS_UPLOAD_FILE_VALIDATOR_HPP

#include "ingress/upload/file_validation_error.hpp"

#include <tl/expected.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace ingress::upload {

inline constexpr std::size_t kMaxFilenameLength = 255;
inline constexpr std::size_t kDefaultMaxUploadMb = 50;
inline constexpr std::uint64_t kBytesPerMb = 1024 * 1024;
/// Largest limit settings accept (1 TiB). validate_upload saturates beyond it.
inline constexpr std::size_t kMaxUploadLimitMb = 1024 * 1024;

// ─────────────────────────────────────────────────────────────────────────────
// Content signatures
// ─────────────────────────────────────────────────────────────────────────────
// Extensions listed here must start with the given bytes. Extensions without
// an entry are accepted on name alone.

struct ContentSignature {
    std::string_view extension;   // Lower-case, with leading dot
    std::string_view magic;
    std::string_view trailer;     // Expected near the end; absence is only a warning
};

inline constexpr std::array<ContentSignature, 1> kContentSignatures = {{
    {".pdf", "%PDF-", "%%EOF"},
}};

[[nodiscard]] std::optional<ContentSignature> signature_for(std::string_view extension) noexcept;

struct ValidatedUpload;

// ─────────────────────────────────────────────────────────────────────────────
// SanitizedFilename
// ─────────────────────────────────────────────────────────────────────────────
// A bare file name with no path components, no control characters and an
// allowed extension. Only validate_upload() produces one.

class SanitizedFilename {
public:
    [[nodiscard]] const std::string& value() const noexcept { return name_; }

    /// Lower-cased extension including the dot (".pdf").
    [[nodiscard]] const std::string& extension() const noexcept { return extension_; }

    [[nodiscard]] std::string_view stem() const noexcept {
        return std::string_view(name_).substr(0, name_.size() - extension_.size());
    }

private:
    friend tl::expected<ValidatedUpload, FileValidationError> validate_upload(
        std::string_view filename,
        std::string_view content,
        std::size_t max_size_mb,
        const std::set<std::string>& allowed_extensions
    );

    SanitizedFilename(std::string name, std::string extension)
        : name_(std::move(name)), extension_(std::move(extension)) {}

    std::string name_;
    std::string extension_;
};

struct ValidatedUpload {
    SanitizedFilename filename;
    double size_mb;
    std::uint64_t size_bytes;
    bool missing_eof_marker;   // Signature ok but trailer absent (possibly truncated)
};

// ─────────────────────────────────────────────────────────────────────────────
// Upload validation
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline std::set<std::string> default_allowed_extensions() {
    return {".pdf"};
}

/// Accept or reject an uploaded file. Checks run in this order: filename,
/// extension, size, content signature. `allowed_extensions` entries may be
/// given with or without the dot and in any case.
[[nodiscard]] tl::expected<ValidatedUpload, FileValidationError> validate_upload(
    std::string_view filename,
    std::string_view content,
    std::size_t max_size_mb = kDefaultMaxUploadMb,
    const std::set<std::string>& allowed_extensions = default_allowed_extensions()
);

/// Filename-only part of validation (steps that do not need the content).
[[nodiscard]] tl::expected<std::string, FileValidationError> sanitize_filename(std::string_view filename);

/// Random name for storing the upload on disk: 32 hex digits in UUIDv4 layout
/// followed by the validated extension. The client-supplied name is never used
/// as a path.
[[nodiscard]] std::string make_storage_name(const SanitizedFilename& filename);

/// Same, for an extension chosen by the caller (".png").
[[nodiscard]] std::string make_storage_name(std::string_view extension);

}  // namespace ingress::upload

#endif  // INGRESS_UPLOAD_FILE_VALIDATOR_HPP
