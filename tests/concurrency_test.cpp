// ═══════════════════════════════════════════════════════════════════════════
// Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════
// The validator and handler are shared read-only across server sessions.

#include <catch2/catch_test_macros.hpp>

#include "redirguard/http/redirect_handler.hpp"
#include "redirguard/http/request_parser.hpp"
#include "redirguard/log/logger.hpp"
#include "redirguard/security/redirect_validator.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace redirguard;
using security::RedirectPolicy;
using security::RedirectValidator;
using security::Verdict;

namespace {

// Counts log calls from any thread
class CountingLogger : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {
        log_count_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return log_count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::size_t> log_count_{0};
};

RedirectPolicy demo_policy() {
    RedirectPolicy policy;
    policy.allowed_hosts = security::AllowList{"trusted.com", "example.com", "ygi.li"};
    return policy;
}

}  // namespace

TEST_CASE("Shared validator classifies consistently across threads", "[concurrency][validator]") {
    constexpr int num_threads = 8;
    constexpr int checks_per_thread = 500;

    const RedirectValidator validator(demo_policy());
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&validator, &mismatches, i]() {
            for (int j = 0; j < checks_per_thread; ++j) {
                const bool trusted = (i + j) % 2 == 0;
                const std::string url = trusted
                    ? "https://example.com/item/" + std::to_string(j)
                    : "https://example.com.attacker" + std::to_string(i) + ".net/";
                const auto verdict = validator.classify(url);
                if ((verdict == Verdict::Allow) != trusted) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(mismatches.load() == 0);
}

TEST_CASE("Shared handler serves requests from many threads", "[concurrency][handler]") {
    constexpr int num_threads = 4;
    constexpr int requests_per_thread = 200;

    auto counting = std::make_unique<CountingLogger>();
    auto* counter = counting.get();
    set_logger(std::move(counting));

    const http::RedirectHandler handler(RedirectValidator(demo_policy()));
    std::atomic<int> redirects{0};
    std::atomic<int> rejections{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < requests_per_thread; ++j) {
                const char* target = (j % 2 == 0)
                    ? "/redirect?url=http://ygi.li/"
                    : "/redirect?url=http://evil.example/";
                auto request = http::parse_request_head(
                    std::string("GET ") + target + " HTTP/1.1\r\nX-Worker: " + std::to_string(i) + "\r\n\r\n");
                if (!request) {
                    continue;
                }
                const auto status = handler.handle(*request).status_code;
                if (status == 302) {
                    redirects.fetch_add(1, std::memory_order_relaxed);
                } else if (status == 400) {
                    rejections.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    const int half = num_threads * requests_per_thread / 2;
    REQUIRE(redirects.load() == half);
    REQUIRE(rejections.load() == half);
    // One access line per request plus one debug line per rejection
    REQUIRE(counter->count() == static_cast<std::size_t>(3 * half));

    set_logger(nullptr);
}

TEST_CASE("Global logger tolerates concurrent reads", "[concurrency][logger]") {
    constexpr int num_threads = 4;
    constexpr int logs_per_thread = 1000;

    auto counting = std::make_unique<CountingLogger>();
    auto* counter = counting.get();
    set_logger(std::move(counting));

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                REDIRGUARD_LOG_DEBUG("worker {} tick {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(counter->count() == static_cast<std::size_t>(num_threads * logs_per_thread));
    set_logger(nullptr);
}
