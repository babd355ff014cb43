#include "ingress/fetch/http_fetcher.hpp"
#include "ingress/log/logger.hpp"

#include <cpr/cpr.h>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace ingress::fetch {

namespace {

constexpr std::string_view kComponent = "fetch";

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpFetcher
// ─────────────────────────────────────────────────────────────────────────────
// The request goes to the validated URL, but libcurl is handed a pre-filled
// DNS entry (cpr::Resolve -> CURLOPT_RESOLVE) for host:port with the addresses
// observed during validation, so no second lookup happens. TLS still verifies
// against the host name.

class CprHttpFetcher final : public IHttpFetcher {
public:
    explicit CprHttpFetcher(FetcherOptions options)
        : options_(options)
    {}

    FetchResult<FetchResponse> get(
        const security::ValidatedUrl& url,
        const HeaderMap& headers
    ) override {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : headers) {
            cpr_headers[name] = value;
        }

        std::string body;
        bool overflowed = false;
        const std::size_t limit = options_.max_body_bytes;
        cpr::WriteCallback on_data{[&body, &overflowed, limit](const std::string_view& data, intptr_t) {
            if (limit != 0 && body.size() + data.size() > limit) {
                overflowed = true;
                return false;  // aborts the transfer
            }
            body.append(data.data(), data.size());
            return true;
        }};

        auto response = cpr::Get(
            cpr::Url{url.href()},
            cpr_headers,
            pinned_resolve(url),
            cpr::Redirect{false},
            cpr::ConnectTimeout{options_.connect_timeout},
            cpr::Timeout{options_.timeout},
            cpr::VerifySsl{options_.verify_ssl},
            on_data
        );

        if (overflowed) {
            get_logger().warn_fmt(kComponent, "Aborted download of {}: body over {} bytes", url.href(), limit);
            return tl::unexpected(FetchError::too_large(limit));
        }
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        FetchResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = std::move(body);
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

private:
    // A literal address host needs no entry: the URL already names the
    // address that was checked.
    static std::vector<cpr::Resolve> pinned_resolve(const security::ValidatedUrl& url) {
        if (url.is_ip_literal()) {
            return {};
        }
        std::string addresses;
        for (const auto& address : url.addresses()) {
            if (!addresses.empty()) {
                addresses += ',';
            }
            addresses += address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
        }
        return {cpr::Resolve{url.host(), addresses, std::set<std::uint16_t>{url.port()}}};
    }

    static FetchError map_error(const cpr::Error& error) {
        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return FetchError::timeout(error.message);
            default:
                return FetchError::connection_failed(error.message);
        }
    }

    FetcherOptions options_;
};

std::unique_ptr<IHttpFetcher> make_http_fetcher(FetcherOptions options) {
    return std::make_unique<CprHttpFetcher>(options);
}

}  // namespace ingress::fetch
