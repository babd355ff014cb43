#include <catch2/catch_test_macros.hpp>

#include "ingress/log/logger.hpp"
#include "mocks/capturing_logger.hpp"

#include <vector>

using namespace ingress;
using ingress::testing::CapturingLogger;
using ingress::testing::ScopedCapture;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Keeps full records (with location and timestamp)
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts names in any case", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == LogLevel::Info);
    REQUIRE(parse_log_level("Warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("critical") == LogLevel::Fatal);
    REQUIRE(parse_log_level("off") == LogLevel::Off);

    SECTION("unknown names use the fallback") {
        REQUIRE(parse_log_level("loud") == LogLevel::Info);
        REQUIRE(parse_log_level("", LogLevel::Error) == LogLevel::Error);
    }
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.debug("url", "test");
    logger.info("url", "test");
    logger.warn("url", "test");
    logger.error("url", "test");
}

TEST_CASE("Logger filters records below its level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.debug("upload", "debug message");
    logger.info("upload", "info message");
    logger.warn("upload", "warn message");
    logger.error("upload", "error message");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].level == LogLevel::Warn);
    REQUIRE(logger.records()[0].message == "warn message");
    REQUIRE(logger.records()[1].level == LogLevel::Error);
}

TEST_CASE("LogRecord carries the component tag", "[log]") {
    TestLogger logger;
    logger.warn("crypto", "key rejected");

    REQUIRE(logger.records().size() == 1);
    REQUIRE(logger.records()[0].component == "crypto");
}

TEST_CASE("Formatted helpers only format enabled levels", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.info_fmt("config", "{} rows", 3);
    logger.warn_fmt("config", "{} rows skipped", 2);
    logger.error_fmt("config", "write to {} failed", "store.json");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].message == "2 rows skipped");
    REQUIRE(logger.records()[1].message == "write to store.json failed");
}

TEST_CASE("LogRecord captures source location", "[log]") {
    TestLogger logger;
    logger.info("url", "test message");

    REQUIRE(logger.records().size() == 1);
    const auto& record = logger.records()[0];

    std::string_view filename(record.location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(record.location.line() > 0);
}

TEST_CASE("LogRecord captures timestamp", "[log]") {
    TestLogger logger;

    auto before = std::chrono::system_clock::now();
    logger.info("url", "test message");
    auto after = std::chrono::system_clock::now();

    REQUIRE(logger.records().size() == 1);
    REQUIRE(logger.records()[0].timestamp >= before);
    REQUIRE(logger.records()[0].timestamp <= after);
}

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("Global logger can be swapped", "[log]") {
    ScopedCapture capture;

    get_logger().info("settings", "test message");

    const auto records = capture->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].component == "settings");
    REQUIRE(records[0].message == "test message");
}

TEST_CASE("INGRESS_LOG macros work correctly", "[log]") {
    ScopedCapture capture(LogLevel::Info);

    INGRESS_LOG_DEBUG("url", "debug");  // filtered
    INGRESS_LOG_INFO("url", "info");
    INGRESS_LOG_WARN("url", "warn");
    INGRESS_LOG_ERROR("url", "error");

    const auto records = capture->records();
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].level == LogLevel::Info);
    REQUIRE(records[1].level == LogLevel::Warn);
    REQUIRE(records[2].level == LogLevel::Error);
}
