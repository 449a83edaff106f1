#include <catch2/catch_test_macros.hpp>

#include "redirguard/log/logger.hpp"

#include <vector>

using namespace redirguard;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Captures log records for verification
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

TEST_CASE("LogLevel names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts names in any case", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("WARN") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("Off") == LogLevel::Off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("NullLogger discards everything", "[log]") {
    NullLogger logger;

    REQUIRE_FALSE(logger.should_log(LogLevel::Error));
    logger.error("ignored");
}

TEST_CASE("Records below the minimum level are dropped", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.debug("debug");
    logger.info("info");
    logger.warn("warn");
    logger.error("error");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].level == LogLevel::Warn);
    REQUIRE(logger.records()[1].message == "error");
}

TEST_CASE("log_fmt formats only enabled levels", "[log]") {
    TestLogger logger(LogLevel::Info);

    logger.log_fmt(LogLevel::Debug, "{} {}", "not", "formatted");
    logger.log_fmt(LogLevel::Info, "{} -> {}", "/redirect", 302);

    REQUIRE(logger.records().size() == 1);
    REQUIRE(logger.records()[0].message == "/redirect -> 302");
}

TEST_CASE("Global logger defaults to NullLogger and can be replaced", "[log]") {
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));

    auto owned = std::make_unique<TestLogger>();
    auto* captured = owned.get();
    set_logger(std::move(owned));

    REDIRGUARD_LOG_INFO("listening on {}:{}", "127.0.0.1", 4000);
    REDIRGUARD_LOG_WARN("plain message");

    REQUIRE(captured->records().size() == 2);
    REQUIRE(captured->records()[0].message == "listening on 127.0.0.1:4000");
    REQUIRE(captured->records()[1].level == LogLevel::Warn);

    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));
}

TEST_CASE("ConsoleLogger honours its level", "[log]") {
    ConsoleLogger logger(LogLevel::Error);

    REQUIRE_FALSE(logger.should_log(LogLevel::Warn));
    REQUIRE(logger.should_log(LogLevel::Error));

    logger.set_level(LogLevel::Debug);
    REQUIRE(logger.should_log(LogLevel::Debug));
    logger.debug("written to stderr");
}
