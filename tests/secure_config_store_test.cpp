// ─────────────────────────────────────────────────────────────────────────────
// SecureConfigStore Tests
// ─────────────────────────────────────────────────────────────────────────────
// Sensitive values are encrypted at rest, legacy plaintext stays readable,
// and nothing secret reaches the display or the log.

#include <catch2/catch_test_macros.hpp>

#include "ingress/config/secure_config_store.hpp"
#include "mocks/capturing_logger.hpp"

#include <filesystem>
#include <vector>

using namespace ingress::config;
using ingress::crypto::CredentialCipher;
using ingress::crypto::FernetKey;
using ingress::LogLevel;
using ingress::testing::ScopedCapture;

namespace {

constexpr std::string_view kSecret = "sk-proj-4f9d2c7a1b8e6f3d0c5a";

FernetKey random_key() {
    auto key = FernetKey::generate();
    REQUIRE(key.has_value());
    return std::move(*key);
}

// True if `a` and `b` share any substring of length `n`
bool shares_substring(std::string_view a, std::string_view b, std::size_t n) {
    if (a.size() < n || b.size() < n) {
        return false;
    }
    for (std::size_t i = 0; i + n <= a.size(); ++i) {
        if (b.find(a.substr(i, n)) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

// Repository whose writes start failing after a fixed number of successes
class FlakyRepository final : public IConfigRepository {
public:
    explicit FlakyRepository(int successes) : remaining_(successes) {}

    std::optional<std::string> load(std::string_view key) const override { return inner_.load(key); }

    tl::expected<void, ConfigStoreError> store(std::string_view key, std::string value) override {
        ++attempts_;
        if (remaining_-- <= 0) {
            return tl::unexpected(ConfigStoreError::storage_failed(std::string(key), "disk full"));
        }
        return inner_.store(key, std::move(value));
    }

    tl::expected<void, ConfigStoreError> store_all(std::map<std::string, std::string> values) override {
        ++attempts_;
        if (remaining_-- <= 0) {
            return tl::unexpected(ConfigStoreError::storage_failed(values.begin()->first, "disk full"));
        }
        return inner_.store_all(std::move(values));
    }

    std::map<std::string, std::string> load_all() const override { return inner_.load_all(); }

    int attempts() const { return attempts_; }

private:
    InMemoryConfigRepository inner_;
    int remaining_;
    int attempts_ = 0;
};

struct StoreFixture {
    CredentialCipher cipher{random_key()};
    InMemoryConfigRepository repo;
    SecureConfigStore store{cipher, repo};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Sensitive Keys
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Sensitive key names are recognised without regard to case", "[config][keys]") {
    REQUIRE(parse_sensitive_key("openai_api_key") == SensitiveKey::OpenAiApiKey);
    REQUIRE(parse_sensitive_key("DeepSeek_API_Key") == SensitiveKey::DeepSeekApiKey);
    REQUIRE(parse_sensitive_key("GEMINI_API_KEY") == SensitiveKey::GeminiApiKey);
    REQUIRE_FALSE(parse_sensitive_key("default_ai_model").has_value());
    REQUIRE_FALSE(parse_sensitive_key("openai_api_key ").has_value());

    for (const auto key : kAllSensitiveKeys) {
        REQUIRE(is_sensitive_key(to_string(key)));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Writes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(StoreFixture, "Sensitive values are stored encrypted", "[config][store]") {
    REQUIRE(store.set_config("openai_api_key", kSecret).has_value());

    const auto raw = repo.load("openai_api_key");
    REQUIRE(raw.has_value());
    REQUIRE(*raw != kSecret);
    REQUIRE(raw->find(kSecret) == std::string::npos);
    REQUIRE(CredentialCipher::looks_like_token(*raw));
    REQUIRE(cipher.is_encrypted(*raw));
}

TEST_CASE_METHOD(StoreFixture, "Non-sensitive values are stored as given", "[config][store]") {
    REQUIRE(store.set_config("default_ai_model", "claude-3-opus").has_value());

    REQUIRE(repo.load("default_ai_model") == std::string("claude-3-opus"));
}

TEST_CASE_METHOD(StoreFixture, "Clearing a sensitive value stores an empty string", "[config][store]") {
    REQUIRE(store.set_config("claude_api_key", kSecret).has_value());
    REQUIRE(store.set_config("claude_api_key", "").has_value());

    REQUIRE(repo.load("claude_api_key") == std::string());
    REQUIRE(store.get_config_value("claude_api_key").empty());
}

TEST_CASE_METHOD(StoreFixture, "Batch update writes every value", "[config][store]") {
    auto result = store.set_configs({
        {"default_ai_model", "gpt-4o"},
        {"gemini_api_key", "AIzaSyExampleKey1234"},
    });

    REQUIRE(result.has_value());
    REQUIRE(repo.load("default_ai_model") == std::string("gpt-4o"));
    REQUIRE(cipher.is_encrypted(*repo.load("gemini_api_key")));
    REQUIRE(store.get_config_value("gemini_api_key") == "AIzaSyExampleKey1234");
}

TEST_CASE("Failed batch update changes nothing", "[config][store]") {
    const CredentialCipher cipher(random_key());
    FlakyRepository repo(1);
    SecureConfigStore store(cipher, repo);
    REQUIRE(store.set_config("default_ai_model", "gpt-4").has_value());

    auto result = store.set_configs({
        {"default_ai_model", "deepseek-chat"},
        {"openai_api_key", std::string(kSecret)},
        {"preset_tags", "[]"},
    });

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigStoreError::Code::StorageFailed);
    REQUIRE(repo.attempts() == 2);
    REQUIRE(repo.load("default_ai_model") == std::string("gpt-4"));
    REQUIRE_FALSE(repo.load("openai_api_key").has_value());
    REQUIRE_FALSE(repo.load("preset_tags").has_value());
}

TEST_CASE("Batch update to a JSON file is all or nothing", "[config][store][file]") {
    const auto dir = std::filesystem::temp_directory_path() / "ingress_store_batch";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const CredentialCipher cipher(random_key());
    JsonFileConfigRepository repo(dir / "config.json");
    SecureConfigStore store(cipher, repo);
    REQUIRE(store.set_config("default_ai_model", "gpt-4").has_value());

    auto result = store.set_configs({
        {"default_ai_model", "deepseek-chat"},
        {"openai_api_key", std::string(kSecret)},
        {"preset_tags", "\xff\xfe not utf-8"},
    });

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigStoreError::Code::StorageFailed);
    REQUIRE(store.get_config_value("default_ai_model") == "gpt-4");
    REQUIRE(store.get_config_value("openai_api_key").empty());
    REQUIRE_FALSE(repo.load("preset_tags").has_value());

    JsonFileConfigRepository reopened(dir / "config.json");
    REQUIRE(reopened.load_all().size() == 1);

    std::filesystem::remove_all(dir);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reads
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(StoreFixture, "Encrypted values read back as plaintext", "[config][store]") {
    REQUIRE(store.set_config("anthropic_api_key", kSecret).has_value());

    REQUIRE(store.get_config_value("anthropic_api_key") == kSecret);
    REQUIRE(store.read_config_value("anthropic_api_key") == std::string(kSecret));
}

TEST_CASE_METHOD(StoreFixture, "Unset keys read as empty", "[config][store]") {
    REQUIRE(store.get_config_value("openai_api_key").empty());
    REQUIRE(store.read_config_value("openai_api_key") == std::string());
}

TEST_CASE("Legacy plaintext rows pass through unchanged", "[config][store]") {
    const CredentialCipher cipher(random_key());
    InMemoryConfigRepository repo({{"openai_api_key", "sk-legacy-plaintext-value"}});
    SecureConfigStore store(cipher, repo);

    REQUIRE(store.get_config_value("openai_api_key") == "sk-legacy-plaintext-value");
    REQUIRE(store.read_config_value("openai_api_key") == std::string("sk-legacy-plaintext-value"));
}

TEST_CASE("Token from another key is distinguished from plaintext", "[config][store]") {
    const CredentialCipher writer(random_key());
    const CredentialCipher reader(random_key());
    auto foreign = writer.encrypt(kSecret);
    REQUIRE(foreign.has_value());

    InMemoryConfigRepository repo({{"openai_api_key", *foreign}});
    SecureConfigStore store(reader, repo);
    ScopedCapture capture;

    SECTION("lenient read returns the stored token") {
        REQUIRE(store.get_config_value("openai_api_key") == *foreign);
    }

    SECTION("strict read reports the failure") {
        auto result = store.read_config_value("openai_api_key");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ConfigStoreError::Code::DecryptionFailed);
        REQUIRE(result.error().key == "openai_api_key");
        REQUIRE(capture->count(LogLevel::Error) == 1);
        REQUIRE_FALSE(capture->contains(*foreign));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Display
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(StoreFixture, "Sensitive values display as a placeholder", "[config][display]") {
    REQUIRE(store.set_config("openai_api_key", kSecret).has_value());
    REQUIRE(store.set_config("default_ai_model", "gpt-4").has_value());

    REQUIRE(store.get_config_for_display("openai_api_key") == kRedactedPlaceholder);
    REQUIRE(store.get_config_for_display("deepseek_api_key").empty());
    REQUIRE(store.get_config_for_display("default_ai_model") == "gpt-4");
}

TEST_CASE_METHOD(StoreFixture, "Displayed value shares nothing with the secret", "[config][display]") {
    const std::vector<std::string> secrets = {
        std::string(kSecret), "AIzaSy-0123456789", "short1",
    };
    for (const auto& secret : secrets) {
        REQUIRE(store.set_config("gemini_api_key", secret).has_value());

        const auto shown = store.get_config_for_display("gemini_api_key");
        REQUIRE_FALSE(shown.empty());
        REQUIRE_FALSE(shares_substring(secret, shown, 4));
        REQUIRE_FALSE(shares_substring(secret, store.get_all_for_display().dump(), 4));
    }
}

TEST_CASE("Legacy plaintext secrets are also masked for display", "[config][display]") {
    const CredentialCipher cipher(random_key());
    InMemoryConfigRepository repo({{"claude_api_key", "claude-plain-legacy"}});
    SecureConfigStore store(cipher, repo);

    REQUIRE(store.get_config_for_display("claude_api_key") == kRedactedPlaceholder);
}

TEST_CASE_METHOD(StoreFixture, "Empty store displays the stock defaults", "[config][display]") {
    const auto all = store.get_all_for_display();

    REQUIRE(all.at("default_ai_model") == "gpt-4");
    REQUIRE(all.at("openai_api_key") == "");
    REQUIRE(all.at("claude_api_key") == "");

    const auto tags = nlohmann::json::parse(all.at("preset_tags").get<std::string>());
    REQUIRE(tags.is_array());
    REQUIRE(tags.size() == 6);
}

TEST_CASE_METHOD(StoreFixture, "Display of all rows masks every sensitive value", "[config][display]") {
    REQUIRE(store.set_configs({
        {"openai_api_key", kSecret},
        {"deepseek_api_key", ""},
        {"default_ai_model", "deepseek-chat"},
    }).has_value());

    const auto all = store.get_all_for_display();

    REQUIRE(all.size() == 3);
    REQUIRE(all.at("openai_api_key") == std::string(kRedactedPlaceholder));
    REQUIRE(all.at("deepseek_api_key") == "");
    REQUIRE(all.at("default_ai_model") == "deepseek-chat");
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(StoreFixture, "Secrets never appear in log lines", "[config][log]") {
    ScopedCapture capture;

    REQUIRE(store.set_config("openai_api_key", kSecret).has_value());
    (void)store.get_config_value("openai_api_key");
    (void)store.read_config_value("openai_api_key");
    (void)store.get_config_for_display("openai_api_key");

    const auto token = repo.load("openai_api_key");
    REQUIRE(token.has_value());

    REQUIRE(capture->count(LogLevel::Info) >= 1);
    REQUIRE(capture->contains("openai_api_key"));
    for (const auto& record : capture->records()) {
        REQUIRE(record.message.find(kSecret) == std::string::npos);
        REQUIRE(record.message.find(*token) == std::string::npos);
    }
}
