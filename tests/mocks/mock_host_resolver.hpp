#ifndef INGRESS_TESTS_MOCKS_MOCK_HOST_RESOLVER_HPP
#define INGRESS_TESTS_MOCKS_MOCK_HOST_RESOLVER_HPP

#include "ingress/security/host_resolver.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ingress::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHostResolver - Test double for IHostResolver
// ─────────────────────────────────────────────────────────────────────────────
// Maps host names to fixed answers so tests can simulate rebinding, NXDOMAIN
// and timeouts without the network. Unknown hosts resolve to NotFound.

class MockHostResolver final : public security::IHostResolver {
public:
    // Answer `host` with the given addresses ("93.184.216.34", "::1", ...)
    void add(const std::string& host, const std::vector<std::string>& addresses) {
        std::vector<asio::ip::address> parsed;
        for (const auto& a : addresses) {
            parsed.push_back(asio::ip::make_address(a));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        answers_[host] = std::move(parsed);
    }

    void fail(const std::string& host, security::ResolveError error) {
        std::lock_guard<std::mutex> lock(mutex_);
        answers_[host] = tl::unexpected(std::move(error));
    }

    [[nodiscard]] std::size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::chrono::milliseconds last_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

    security::ResolveResult resolve(
        std::string_view host,
        std::uint16_t /*port*/,
        std::chrono::milliseconds timeout
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.emplace_back(host);
        last_timeout_ = timeout;

        auto it = answers_.find(std::string(host));
        if (it == answers_.end()) {
            return tl::unexpected(security::ResolveError::not_found("Host not found"));
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, security::ResolveResult> answers_;
    std::vector<std::string> calls_;
    std::chrono::milliseconds last_timeout_{0};
};

}  // namespace ingress::testing

#endif  // INGRESS_TESTS_MOCKS_MOCK_HOST_RESOLVER_HPP
