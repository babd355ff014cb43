#pragma once

#include "ingress/fetch/http_fetcher.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace ingress::fetch {

struct ImageDownloadLimits {
    std::size_t max_bytes{10 * 1024 * 1024};
};

struct DownloadedImage {
    std::string body;
    std::string media_type;     // "image/png"
    std::string extension;      // ".png"
    std::string storage_name;   // Random name to save under
};

/// Fetch an image from a validated URL. The response must be 2xx, carry an
/// image/* content type and fit in `limits.max_bytes`.
[[nodiscard]] FetchResult<DownloadedImage> download_image(
    IHttpFetcher& fetcher,
    const security::ValidatedUrl& url,
    const ImageDownloadLimits& limits = {}
);

/// Extension of the last path segment (".jpg"), else one derived from the
/// media type, else ".jpg".
[[nodiscard]] std::string image_extension(std::string_view url_path, std::string_view media_type);

/// Request headers sent with image downloads.
[[nodiscard]] HeaderMap default_image_headers();

}  // namespace ingress::fetch
