#ifndef INGRESS_CONFIG_CONFIG_REPOSITORY_HPP
#define INGRESS_CONFIG_CONFIG_REPOSITORY_HPP

#include "ingress/config/config_store_error.hpp"

#include <tl/expected.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ingress::config {

// ─────────────────────────────────────────────────────────────────────────────
// IConfigRepository
// ─────────────────────────────────────────────────────────────────────────────
// Persistence for configuration rows. Values are stored exactly as given; the
// repository never sees plaintext for sensitive keys. store() is atomic per
// key; store_all() applies a whole batch or none of it.

class IConfigRepository {
public:
    virtual ~IConfigRepository() = default;

    [[nodiscard]] virtual std::optional<std::string> load(std::string_view key) const = 0;

    [[nodiscard]] virtual tl::expected<void, ConfigStoreError> store(
        std::string_view key, std::string value) = 0;

    [[nodiscard]] virtual tl::expected<void, ConfigStoreError> store_all(
        std::map<std::string, std::string> values) = 0;

    [[nodiscard]] virtual std::map<std::string, std::string> load_all() const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// InMemoryConfigRepository
// ─────────────────────────────────────────────────────────────────────────────

class InMemoryConfigRepository final : public IConfigRepository {
public:
    InMemoryConfigRepository() = default;
    explicit InMemoryConfigRepository(std::map<std::string, std::string> rows);

    [[nodiscard]] std::optional<std::string> load(std::string_view key) const override;
    [[nodiscard]] tl::expected<void, ConfigStoreError> store(std::string_view key, std::string value) override;
    [[nodiscard]] tl::expected<void, ConfigStoreError> store_all(std::map<std::string, std::string> values) override;
    [[nodiscard]] std::map<std::string, std::string> load_all() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> rows_;
};

// ─────────────────────────────────────────────────────────────────────────────
// JsonFileConfigRepository
// ─────────────────────────────────────────────────────────────────────────────
// Rows kept in a flat JSON object ({"key": "value", ...}). Every write
// rewrites the file through a temporary and a rename, so a crash leaves either
// the old or the new file. A write that cannot be persisted (I/O failure, a
// value that is not valid UTF-8) is reported as StorageFailed and leaves the
// in-memory rows as they were. A missing file is an empty repository; a file
// that is not a JSON object of strings throws std::runtime_error at
// construction.

class JsonFileConfigRepository final : public IConfigRepository {
public:
    explicit JsonFileConfigRepository(std::filesystem::path path);

    [[nodiscard]] std::optional<std::string> load(std::string_view key) const override;
    [[nodiscard]] tl::expected<void, ConfigStoreError> store(std::string_view key, std::string value) override;
    [[nodiscard]] tl::expected<void, ConfigStoreError> store_all(std::map<std::string, std::string> values) override;
    [[nodiscard]] std::map<std::string, std::string> load_all() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    [[nodiscard]] tl::expected<void, ConfigStoreError> flush_locked(std::string_view key) const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> rows_;
};

}  // namespace ingress::config

#endif  // INGRESS_CONFIG_CONFIG_REPOSITORY_HPP
