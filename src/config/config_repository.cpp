#include "ingress/config/config_repository.hpp"
#include "ingress/log/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace ingress::config {

namespace {

constexpr std::string_view kComponent = "config";

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// InMemoryConfigRepository
// ─────────────────────────────────────────────────────────────────────────────

InMemoryConfigRepository::InMemoryConfigRepository(std::map<std::string, std::string> rows)
    : rows_(rows.begin(), rows.end())
{}

std::optional<std::string> InMemoryConfigRepository::load(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(key);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

tl::expected<void, ConfigStoreError> InMemoryConfigRepository::store(std::string_view key, std::string value) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.insert_or_assign(std::string(key), std::move(value));
    return {};
}

tl::expected<void, ConfigStoreError> InMemoryConfigRepository::store_all(std::map<std::string, std::string> values) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, value] : values) {
        rows_.insert_or_assign(key, std::move(value));
    }
    return {};
}

std::map<std::string, std::string> InMemoryConfigRepository::load_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {rows_.begin(), rows_.end()};
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonFileConfigRepository
// ─────────────────────────────────────────────────────────────────────────────

JsonFileConfigRepository::JsonFileConfigRepository(std::filesystem::path path)
    : path_(std::move(path))
{
    std::ifstream in(path_);
    if (!in) {
        get_logger().info_fmt(kComponent, "Config file {} not found, starting empty", path_.string());
        return;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Config file " + path_.string() + " is not valid JSON: " + e.what());
    }

    if (!doc.is_object()) {
        throw std::runtime_error("Config file " + path_.string() + " must contain a JSON object");
    }
    for (const auto& [key, value] : doc.items()) {
        if (!value.is_string()) {
            throw std::runtime_error("Config value for '" + key + "' in " + path_.string() +
                                     " is not a string");
        }
        rows_.emplace(key, value.get<std::string>());
    }
    get_logger().info_fmt(kComponent, "Loaded {} config entr{} from {}", rows_.size(),
                          rows_.size() == 1 ? "y" : "ies", path_.string());
}

std::optional<std::string> JsonFileConfigRepository::load(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(key);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

tl::expected<void, ConfigStoreError> JsonFileConfigRepository::store(std::string_view key, std::string value) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<std::string> previous;
    if (auto it = rows_.find(key); it != rows_.end()) {
        previous = it->second;
    }
    rows_.insert_or_assign(std::string(key), std::move(value));

    auto flushed = flush_locked(key);
    if (!flushed) {
        // Keep memory consistent with what is on disk.
        if (previous) {
            rows_.insert_or_assign(std::string(key), std::move(*previous));
        } else {
            rows_.erase(rows_.find(key));
        }
    }
    return flushed;
}

tl::expected<void, ConfigStoreError> JsonFileConfigRepository::store_all(std::map<std::string, std::string> values) {
    if (values.empty()) {
        return {};
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto snapshot = rows_;
    const std::string first_key = values.begin()->first;
    for (auto& [key, value] : values) {
        rows_.insert_or_assign(key, std::move(value));
    }

    auto flushed = flush_locked(first_key);
    if (!flushed) {
        rows_ = std::move(snapshot);
    }
    return flushed;
}

std::map<std::string, std::string> JsonFileConfigRepository::load_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {rows_.begin(), rows_.end()};
}

tl::expected<void, ConfigStoreError> JsonFileConfigRepository::flush_locked(std::string_view key) const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [k, v] : rows_) {
        doc[k] = v;
    }

    std::string text;
    try {
        text = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        get_logger().error_fmt(kComponent, "Cannot serialise config '{}' (json error {})", key, e.id);
        return tl::unexpected(ConfigStoreError::storage_failed(
            std::string(key), "Value cannot be written as JSON (not valid UTF-8)"));
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return tl::unexpected(ConfigStoreError::storage_failed(
                std::string(key), "Cannot open " + tmp.string() + " for writing"));
        }
        out << text << '\n';
        if (!out.flush()) {
            return tl::unexpected(ConfigStoreError::storage_failed(
                std::string(key), "Failed writing " + tmp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        auto message = "Cannot replace " + path_.string() + ": " + ec.message();
        std::error_code remove_ec;
        std::filesystem::remove(tmp, remove_ec);
        return tl::unexpected(ConfigStoreError::storage_failed(std::string(key), std::move(message)));
    }
    return {};
}

}  // namespace ingress::config
