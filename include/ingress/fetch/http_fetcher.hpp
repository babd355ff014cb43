#pragma once

#include "ingress/fetch/fetch_error.hpp"
#include "ingress/fetch/http_types.hpp"
#include "ingress/security/url_validator.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace ingress::fetch {

template <typename T>
using FetchResult = tl::expected<T, FetchError>;

struct FetcherOptions {
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds timeout{30'000};

    // Reading stops once the body passes this size. 0 = no limit.
    std::size_t max_body_bytes{10 * 1024 * 1024};

    bool verify_ssl{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpFetcher
// ─────────────────────────────────────────────────────────────────────────────
// Outbound GET for a URL that has already been validated. Implementations
// connect to one of ValidatedUrl::addresses() instead of resolving the host
// again, keep the original host name for SNI and the Host header, and never
// follow redirects (a redirect target has not been validated).

class IHttpFetcher {
public:
    virtual ~IHttpFetcher() = default;

    [[nodiscard]] virtual FetchResult<FetchResponse> get(
        const security::ValidatedUrl& url,
        const HeaderMap& headers = {}
    ) = 0;
};

/// cpr/libcurl implementation, pinned with CURLOPT_RESOLVE.
std::unique_ptr<IHttpFetcher> make_http_fetcher(FetcherOptions options = {});

}  // namespace ingress::fetch
