#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ingress::fetch {

// Header names compare case-insensitively (RFC 9110); the map keeps whatever
// spelling the server sent.
using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        const auto& key = pair.first;
        return key.size() == name.size() &&
               std::ranges::equal(key, name, [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
}

inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

struct FetchResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    /// Lower-cased media type without parameters ("image/png"), or empty.
    [[nodiscard]] std::string media_type() const {
        auto value = get_header(headers, "Content-Type").value_or("");
        if (const auto semi = value.find(';'); semi != std::string::npos) {
            value.resize(semi);
        }
        while (!value.empty() && value.back() == ' ') value.pop_back();
        while (!value.empty() && value.front() == ' ') value.erase(value.begin());
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
};

}  // namespace ingress::fetch
