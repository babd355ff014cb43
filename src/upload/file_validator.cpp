#include "ingress/upload/file_validator.hpp"
#include "ingress/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <random>

namespace ingress::upload {

namespace {

constexpr std::string_view kComponent = "upload";

// Any of these anywhere in the name rejects it outright.
constexpr std::array<std::string_view, 7> kDangerousSequences = {
    "..", "/", "\\", std::string_view("\0", 1), "\n", "\r", "\t",
};

[[nodiscard]] bool is_control(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return uc < 0x20 || uc == 0x7f;
}

// U+0080..U+009F encoded as UTF-8 (0xC2 0x80..0x9F).
[[nodiscard]] bool is_c1_control(std::string_view s, std::size_t i) noexcept {
    if (i + 1 >= s.size() || static_cast<unsigned char>(s[i]) != 0xC2) {
        return false;
    }
    const auto next = static_cast<unsigned char>(s[i + 1]);
    return next >= 0x80 && next <= 0x9F;
}

[[nodiscard]] bool is_trailing_whitespace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] std::string normalize_extension(std::string_view ext) {
    std::string out = to_lower(ext);
    if (!out.empty() && out.front() != '.') {
        out.insert(out.begin(), '.');
    }
    return out;
}

// ".pdf" for "report.PDF"; empty when there is no dot or nothing after it.
[[nodiscard]] std::string extension_of(std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }
    return to_lower(name.substr(dot));
}

[[nodiscard]] tl::unexpected<FileValidationError> reject(FileValidationError error) {
    get_logger().warn_fmt(kComponent, "Upload rejected ({}): {}", to_string(error.code), error.message);
    return tl::unexpected(std::move(error));
}

}  // namespace

std::optional<ContentSignature> signature_for(std::string_view extension) noexcept {
    for (const auto& sig : kContentSignatures) {
        if (sig.extension == extension) {
            return sig;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Filename
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::string, FileValidationError> sanitize_filename(std::string_view filename) {
    if (filename.empty()) {
        return tl::unexpected(FileValidationError::filename_invalid("Filename is empty"));
    }

    for (const auto seq : kDangerousSequences) {
        if (filename.find(seq) != std::string_view::npos) {
            return tl::unexpected(FileValidationError::filename_invalid(
                "Filename contains a path separator, '..' or a control character"));
        }
    }

    if (filename.size() > kMaxFilenameLength) {
        return tl::unexpected(FileValidationError::filename_invalid(
            "Filename is longer than " + std::to_string(kMaxFilenameLength) + " bytes"));
    }

    std::string name;
    name.reserve(filename.size());
    for (std::size_t i = 0; i < filename.size(); ++i) {
        if (is_c1_control(filename, i)) {
            ++i;
            continue;
        }
        if (!is_control(filename[i])) {
            name.push_back(filename[i]);
        }
    }

    const auto first = name.find_first_not_of(". ");
    if (first == std::string::npos) {
        return tl::unexpected(FileValidationError::filename_invalid("Filename is blank after sanitisation"));
    }
    const auto last = name.find_last_not_of(". ");
    return name.substr(first, last - first + 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Upload validation
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<ValidatedUpload, FileValidationError> validate_upload(
    std::string_view filename,
    std::string_view content,
    std::size_t max_size_mb,
    const std::set<std::string>& allowed_extensions
) {
    auto name = sanitize_filename(filename);
    if (!name) {
        return reject(std::move(name.error()));
    }

    const std::string extension = extension_of(*name);
    const bool allowed = !extension.empty() &&
        std::any_of(allowed_extensions.begin(), allowed_extensions.end(),
                    [&](const std::string& e) { return normalize_extension(e) == extension; });
    if (!allowed) {
        std::string list;
        for (const auto& e : allowed_extensions) {
            if (!list.empty()) list += ", ";
            list += normalize_extension(e);
        }
        return reject(FileValidationError::extension_not_allowed(
            "File type '" + (extension.empty() ? std::string("(none)") : extension) +
            "' is not allowed. Allowed types: " + list));
    }

    const std::uint64_t size_bytes = content.size();
    constexpr auto kNoLimit = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t max_bytes = static_cast<std::uint64_t>(max_size_mb) > kNoLimit / kBytesPerMb
        ? kNoLimit
        : static_cast<std::uint64_t>(max_size_mb) * kBytesPerMb;
    if (size_bytes > max_bytes) {
        return reject(FileValidationError::file_too_large(size_bytes, max_bytes));
    }

    bool missing_eof_marker = false;
    if (const auto sig = signature_for(extension)) {
        if (content.size() < sig->magic.size()) {
            return reject(FileValidationError::content_signature(
                "File is too small to be a valid " + extension + " file"));
        }
        if (!content.starts_with(sig->magic)) {
            return reject(FileValidationError::content_signature(
                "File content does not match its " + extension + " extension"));
        }

        if (!sig->trailer.empty()) {
            auto body = content;
            while (!body.empty() && is_trailing_whitespace(body.back())) body.remove_suffix(1);
            if (!body.ends_with(sig->trailer)) {
                missing_eof_marker = true;
                get_logger().warn_fmt(kComponent, "'{}' has no {} marker; file may be truncated",
                                      *name, sig->trailer);
            }
        }
    }

    ValidatedUpload result{
        SanitizedFilename(std::move(*name), extension),
        static_cast<double>(size_bytes) / static_cast<double>(kBytesPerMb),
        size_bytes,
        missing_eof_marker,
    };
    get_logger().info_fmt(kComponent, "Upload accepted: {} ({} bytes)",
                          result.filename.value(), result.size_bytes);
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Storage name
// ─────────────────────────────────────────────────────────────────────────────

std::string make_storage_name(const SanitizedFilename& filename) {
    return make_storage_name(std::string_view(filename.extension()));
}

std::string make_storage_name(std::string_view extension) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    constexpr std::string_view kHex = "0123456789abcdef";
    std::string out;
    out.reserve(36 + extension.size());
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            out.push_back('-');
        }
        int value = nibble(rng);
        if (i == 12) {
            value = 4;                    // version
        } else if (i == 16) {
            value = (value & 0x3) | 0x8;  // variant 10xx
        }
        out.push_back(kHex[static_cast<std::size_t>(value)]);
    }
    out += extension;
    return out;
}

}  // namespace ingress::upload
