#include "ingress/security/host_resolver.hpp"
#include "ingress/log/logger.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <future>
#include <memory>

namespace ingress::security {

AsioHostResolver::AsioHostResolver(std::size_t worker_threads)
    : pool_(worker_threads == 0 ? 1 : worker_threads)
{}

AsioHostResolver::~AsioHostResolver() {
    pool_.stop();
    pool_.join();
}

ResolveResult AsioHostResolver::resolve(
    std::string_view host,
    std::uint16_t port,
    std::chrono::milliseconds timeout
) {
    // The promise is shared with the worker so an abandoned lookup can still
    // complete safely after this call has returned.
    auto promise = std::make_shared<std::promise<ResolveResult>>();
    auto future = promise->get_future();

    asio::post(pool_, [promise, host = std::string(host), port]() {
        asio::io_context io;
        asio::ip::tcp::resolver resolver(io);

        // No address_configured: every record is checked and pinned, and an
        // unreachable family is simply skipped by the fetcher.
        asio::error_code ec;
        const auto results = resolver.resolve(host, std::to_string(port),
                                              asio::ip::tcp::resolver::numeric_service, ec);
        if (ec) {
            if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again ||
                ec == asio::error::no_data) {
                promise->set_value(tl::unexpected(ResolveError::not_found(ec.message())));
            } else {
                promise->set_value(tl::unexpected(ResolveError::failed(ec.message())));
            }
            return;
        }

        std::vector<asio::ip::address> addresses;
        for (const auto& entry : results) {
            const auto address = entry.endpoint().address();
            if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
                addresses.push_back(address);
            }
        }

        if (addresses.empty()) {
            promise->set_value(tl::unexpected(ResolveError::not_found("no addresses returned")));
        } else {
            promise->set_value(std::move(addresses));
        }
    });

    if (future.wait_for(timeout) != std::future_status::ready) {
        get_logger().warn_fmt("url", "DNS lookup for '{}' exceeded {} ms", host, timeout.count());
        return tl::unexpected(ResolveError::timeout(
            "lookup did not complete within " + std::to_string(timeout.count()) + " ms"));
    }
    return future.get();
}

}  // namespace ingress::security
