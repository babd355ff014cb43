#ifndef INGRESS_SECURITY_HOST_RESOLVER_HPP
#define INGRESS_SECURITY_HOST_RESOLVER_HPP

#include <asio/ip/address.hpp>
#include <asio/thread_pool.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ingress::security {

// ─────────────────────────────────────────────────────────────────────────────
// Resolve Error
// ─────────────────────────────────────────────────────────────────────────────

struct ResolveError {
    enum class Code {
        NotFound,   // NXDOMAIN / no address records
        Timeout,    // Did not complete within the caller's budget
        Failed      // Any other resolver failure
    };

    Code code;
    std::string message;

    [[nodiscard]] static ResolveError not_found(std::string msg) {
        return {Code::NotFound, std::move(msg)};
    }
    [[nodiscard]] static ResolveError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }
    [[nodiscard]] static ResolveError failed(std::string msg) {
        return {Code::Failed, std::move(msg)};
    }
};

using ResolveResult = tl::expected<std::vector<asio::ip::address>, ResolveError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHostResolver
// ─────────────────────────────────────────────────────────────────────────────
// Seam between the URL validator and DNS. Tests substitute a resolver that
// returns fixed addresses to simulate rebinding without touching the network.

class IHostResolver {
public:
    virtual ~IHostResolver() = default;

    /// Resolve `host` to every address it currently maps to. Must return
    /// within roughly `timeout`; an empty address list is never a success.
    [[nodiscard]] virtual ResolveResult resolve(
        std::string_view host,
        std::uint16_t port,
        std::chrono::milliseconds timeout
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// AsioHostResolver - system resolver (getaddrinfo) through asio
// ─────────────────────────────────────────────────────────────────────────────
// getaddrinfo cannot be interrupted, so lookups run on a small worker pool and
// the caller waits on the result for at most the timeout. A lookup that
// overruns is abandoned: the caller gets Timeout immediately and the worker
// finishes in the background. When every worker is stuck, new lookups time
// out too, which fails closed.

class AsioHostResolver final : public IHostResolver {
public:
    explicit AsioHostResolver(std::size_t worker_threads = 4);
    ~AsioHostResolver() override;

    AsioHostResolver(const AsioHostResolver&) = delete;
    AsioHostResolver& operator=(const AsioHostResolver&) = delete;

    [[nodiscard]] ResolveResult resolve(
        std::string_view host,
        std::uint16_t port,
        std::chrono::milliseconds timeout
    ) override;

private:
    asio::thread_pool pool_;
};

}  // namespace ingress::security

#endif  // INGRESS_SECURITY_HOST_RESOLVER_HPP
