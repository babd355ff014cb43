// ─────────────────────────────────────────────────────────────────────────────
// IngressSettings Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "ingress/settings.hpp"
#include "ingress/upload/file_validator.hpp"
#include "mocks/capturing_logger.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace ingress;
using ingress::testing::ScopedCapture;
using namespace std::chrono_literals;

namespace {

const std::vector<const char*> kSettingsVariables = {
    "ENCRYPTION_KEY", "CONFIG_ENCRYPTION_KEY", "ALLOWED_IMAGE_DOMAINS", "DEV_MODE",
    "INGRESS_MAX_UPLOAD_MB", "INGRESS_DNS_TIMEOUT_MS", "INGRESS_LOG_LEVEL",
};

// Clears every settings variable on entry and exit
class ScopedEnvironment {
public:
    ScopedEnvironment() { clear(); }
    ~ScopedEnvironment() { clear(); }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    void set(const char* name, const std::string& value) {
        ::setenv(name, value.c_str(), 1);
    }

private:
    static void clear() {
        for (const char* name : kSettingsVariables) {
            ::unsetenv(name);
        }
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Defaults and Builders
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Default settings are valid", "[settings]") {
    const IngressSettings settings;

    REQUIRE(settings.is_valid());
    REQUIRE_FALSE(settings.encryption_key.has_value());
    REQUIRE_FALSE(settings.dev_mode);
    REQUIRE(settings.max_upload_mb == 50);
    REQUIRE(settings.dns_timeout == 3000ms);
    REQUIRE(settings.allowed_extensions == std::set<std::string>{".pdf"});
    REQUIRE(settings.log_level == LogLevel::Info);
}

TEST_CASE("Builders chain", "[settings]") {
    IngressSettings settings;
    settings.with_encryption_key("key")
        .with_allowed_domain("cdn.example.org")
        .with_dev_mode(true)
        .with_dns_timeout(500ms)
        .with_max_upload_mb(5)
        .with_allowed_extension(".txt")
        .with_log_level(LogLevel::Debug);

    REQUIRE(settings.encryption_key == std::string("key"));
    REQUIRE(settings.extra_allowed_domains == std::vector<std::string>{"cdn.example.org"});
    REQUIRE(settings.dev_mode);
    REQUIRE(settings.dns_timeout == 500ms);
    REQUIRE(settings.max_upload_mb == 5);
    REQUIRE(settings.allowed_extensions.count(".txt") == 1);
    REQUIRE(settings.log_level == LogLevel::Debug);

    const auto url = settings.url_config();
    REQUIRE(url.dns_timeout == 500ms);
    REQUIRE(url.max_url_length == settings.max_url_length);
}

TEST_CASE("Largest upload limit is still valid", "[settings]") {
    IngressSettings settings;
    settings.with_max_upload_mb(upload::kMaxUploadLimitMb);

    REQUIRE(settings.is_valid());
}

TEST_CASE("Validation reports the first problem", "[settings]") {
    IngressSettings settings;

    SECTION("upload limit") {
        settings.with_max_upload_mb(0);
        REQUIRE(settings.validation_error() == "Upload size limit must be at least 1 MB");
    }

    SECTION("upload limit too large") {
        settings.with_max_upload_mb(std::size_t{1} << 44);
        REQUIRE(settings.validation_error() == "Upload size limit must be at most 1048576 MB");
    }

    SECTION("DNS timeout") {
        settings.with_dns_timeout(0ms);
        REQUIRE(settings.validation_error() == "DNS timeout must be positive");
    }

    SECTION("URL length") {
        settings.max_url_length = 0;
        REQUIRE(settings.validation_error() == "Maximum URL length must be positive");
    }

    SECTION("extensions") {
        settings.allowed_extensions.clear();
        REQUIRE(settings.validation_error() == "At least one upload extension must be allowed");
    }

    SECTION("empty key") {
        settings.with_encryption_key("");
        REQUIRE(settings.validation_error() == "Encryption key is set but empty");
    }

    REQUIRE_FALSE(settings.is_valid());
}

TEST_CASE("Allow list combines defaults and extra domains", "[settings]") {
    IngressSettings settings;
    settings.with_allowed_domain("cdn.example.org");

    const auto list = settings.make_allow_list();

    REQUIRE(list.is_enforced());
    REQUIRE(list.allows("i.imgur.com"));
    REQUIRE(list.allows("cdn.example.org"));
    REQUIRE_FALSE(list.allows("attacker.example.net"));
}

TEST_CASE("Development mode disables the allow list", "[settings]") {
    ScopedCapture capture;
    IngressSettings settings;
    settings.with_dev_mode(true);

    const auto list = settings.make_allow_list();

    REQUIRE(list.mode() == security::DomainAllowList::Mode::Disabled);
    REQUIRE(list.allows("attacker.example.net"));
}

TEST_CASE("Environment flags accept the usual spellings", "[settings]") {
    for (std::string_view yes : {"true", "TRUE", "1", "yes", "Yes"}) {
        REQUIRE(parse_env_flag(yes));
    }
    for (std::string_view no : {"", "0", "false", "no", "on", "truthy", "y"}) {
        REQUIRE_FALSE(parse_env_flag(no));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Empty environment gives the defaults", "[settings][env]") {
    ScopedEnvironment env;

    const auto settings = IngressSettings::from_environment();

    REQUIRE_FALSE(settings.encryption_key.has_value());
    REQUIRE(settings.extra_allowed_domains.empty());
    REQUIRE_FALSE(settings.dev_mode);
    REQUIRE(settings.max_upload_mb == 50);
    REQUIRE(settings.dns_timeout == 3000ms);
}

TEST_CASE("Environment values are read", "[settings][env]") {
    ScopedEnvironment env;
    env.set("ENCRYPTION_KEY", "primary-key");
    env.set("ALLOWED_IMAGE_DOMAINS", "cdn.example.org, img.example.net");
    env.set("DEV_MODE", "yes");
    env.set("INGRESS_MAX_UPLOAD_MB", "20");
    env.set("INGRESS_DNS_TIMEOUT_MS", "750");
    env.set("INGRESS_LOG_LEVEL", "debug");

    const auto settings = IngressSettings::from_environment();

    REQUIRE(settings.encryption_key == std::string("primary-key"));
    REQUIRE(settings.extra_allowed_domains == std::vector<std::string>{"cdn.example.org", "img.example.net"});
    REQUIRE(settings.dev_mode);
    REQUIRE(settings.max_upload_mb == 20);
    REQUIRE(settings.dns_timeout == 750ms);
    REQUIRE(settings.log_level == LogLevel::Debug);
}

TEST_CASE("Fallback key variable is honoured", "[settings][env]") {
    ScopedEnvironment env;
    env.set("CONFIG_ENCRYPTION_KEY", "fallback-key");

    SECTION("alone") {
        REQUIRE(IngressSettings::from_environment().encryption_key == std::string("fallback-key"));
    }

    SECTION("primary wins when both are set") {
        env.set("ENCRYPTION_KEY", "primary-key");
        REQUIRE(IngressSettings::from_environment().encryption_key == std::string("primary-key"));
    }

    SECTION("empty primary is treated as unset") {
        env.set("ENCRYPTION_KEY", "");
        REQUIRE(IngressSettings::from_environment().encryption_key == std::string("fallback-key"));
    }
}

TEST_CASE("Malformed numbers keep the defaults", "[settings][env]") {
    ScopedEnvironment env;
    ScopedCapture capture;
    env.set("INGRESS_MAX_UPLOAD_MB", "lots");
    env.set("INGRESS_DNS_TIMEOUT_MS", "-5");

    const auto settings = IngressSettings::from_environment();

    REQUIRE(settings.max_upload_mb == 50);
    REQUIRE(settings.dns_timeout == 3000ms);
    REQUIRE(capture->count(LogLevel::Warn) >= 2);
    REQUIRE(capture->contains("INGRESS_MAX_UPLOAD_MB"));
}

TEST_CASE("Unknown log level falls back to info", "[settings][env]") {
    ScopedEnvironment env;
    env.set("INGRESS_LOG_LEVEL", "chatty");

    REQUIRE(IngressSettings::from_environment().log_level == LogLevel::Info);
}
