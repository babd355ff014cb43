#include "ingress/fetch/image_download.hpp"
#include "ingress/log/logger.hpp"
#include "ingress/upload/file_validator.hpp"

#include <algorithm>
#include <cctype>

namespace ingress::fetch {

namespace {

constexpr std::string_view kComponent = "fetch";

[[nodiscard]] bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

HeaderMap default_image_headers() {
    return {
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                       "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36"},
        {"Accept", "image/webp,image/apng,image/*,*/*;q=0.8"},
        {"Accept-Language", "zh-CN,zh;q=0.9,en;q=0.8"},
    };
}

std::string image_extension(std::string_view url_path, std::string_view media_type) {
    const auto slash = url_path.rfind('/');
    const auto segment = slash == std::string_view::npos ? url_path : url_path.substr(slash + 1);
    const auto dot = segment.rfind('.');
    if (dot != std::string_view::npos && dot != 0 && dot + 1 < segment.size()) {
        std::string ext(segment.substr(dot));
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const bool plain = std::all_of(ext.begin() + 1, ext.end(),
                                       [](unsigned char c) { return std::isalnum(c) != 0; });
        if (plain && ext.size() <= 6) {
            return ext;
        }
    }

    if (contains(media_type, "jpeg") || contains(media_type, "jpg")) return ".jpg";
    if (contains(media_type, "png")) return ".png";
    if (contains(media_type, "gif")) return ".gif";
    if (contains(media_type, "webp")) return ".webp";
    return ".jpg";
}

FetchResult<DownloadedImage> download_image(
    IHttpFetcher& fetcher,
    const security::ValidatedUrl& url,
    const ImageDownloadLimits& limits
) {
    get_logger().info_fmt(kComponent, "Downloading image {}", url.href());

    auto response = fetcher.get(url, default_image_headers());
    if (!response) {
        get_logger().warn_fmt(kComponent, "Image download failed ({}): {}",
                              to_string(response.error().code), response.error().message);
        return tl::unexpected(response.error());
    }

    if (!response->is_success()) {
        get_logger().warn_fmt(kComponent, "Image download got HTTP {}", response->status_code);
        return tl::unexpected(FetchError::http_status(response->status_code));
    }

    auto media_type = response->media_type();
    if (!media_type.starts_with("image/")) {
        get_logger().warn_fmt(kComponent, "URL is not an image: '{}'", media_type);
        return tl::unexpected(FetchError::not_an_image(media_type));
    }

    if (response->body.size() > limits.max_bytes) {
        return tl::unexpected(FetchError::too_large(limits.max_bytes));
    }

    DownloadedImage image;
    image.extension = image_extension(url.path(), media_type);
    image.storage_name = upload::make_storage_name(image.extension);
    image.media_type = std::move(media_type);
    image.body = std::move(response->body);

    get_logger().info_fmt(kComponent, "Image downloaded: {} bytes, {}", image.body.size(), image.media_type);
    return image;
}

}  // namespace ingress::fetch
