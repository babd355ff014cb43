// Example 02: Validate a URL, then Fetch the Image
//
// Runs the SSRF checks on a user-supplied image URL and, if it passes,
// downloads it pinned to the addresses that were checked.
//
// Usage: 02_validate_and_fetch [url]

#include <ingress/fetch/image_download.hpp>
#include <ingress/log/spdlog_logger.hpp>
#include <ingress/security/host_resolver.hpp>
#include <ingress/security/url_validator.hpp>
#include <ingress/settings.hpp>

#include <iostream>
#include <string>

using namespace ingress;

int main(int argc, char* argv[]) {
    std::string url = "https://images.unsplash.com/photo-1500530855697-b586d89ba3ee?w=200";
    if (argc > 1) {
        url = argv[1];
    }

    std::cout << "=== Validate and Fetch Example ===\n\n";

    const auto settings = IngressSettings::from_environment();
    set_logger(make_spdlog_console_logger(settings.log_level));

    // 1. Validate
    security::AsioHostResolver resolver;
    auto validated = security::validate_url(url, settings.make_allow_list(), resolver, settings.url_config());
    if (!validated) {
        std::cerr << "REJECTED [" << security::to_string(validated.error().code) << "] "
                  << validated.error().message << "\n";
        return 1;
    }

    std::cout << "Accepted " << validated->host() << ", pinned to:\n";
    for (const auto& address : validated->addresses()) {
        std::cout << "  " << address.to_string() << "\n";
    }

    // 2. Fetch
    auto fetcher = fetch::make_http_fetcher();
    auto image = fetch::download_image(*fetcher, *validated);
    if (!image) {
        std::cerr << "DOWNLOAD FAILED [" << fetch::to_string(image.error().code) << "] "
                  << image.error().message << "\n";
        return 1;
    }

    std::cout << "\nDownloaded " << image->body.size() << " bytes of " << image->media_type
              << ", would be saved as " << image->storage_name << "\n";
    return 0;
}
