// ─────────────────────────────────────────────────────────────────────────────
// Redirect Validator Tests
// ─────────────────────────────────────────────────────────────────────────────
// Allow-list decisions for caller-supplied redirect destinations.

#include <catch2/catch_test_macros.hpp>

#include "redirguard/security/redirect_validator.hpp"

#include <string>
#include <vector>

using namespace redirguard::security;

namespace {

RedirectPolicy demo_policy() {
    RedirectPolicy policy;
    policy.allowed_hosts = AllowList{"trusted.com", "example.com"};
    return policy;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// AllowList
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("AllowList matches exact members only", "[security][allowlist]") {
    AllowList list{"trusted.com", "example.com", "trusted.com"};

    REQUIRE(list.size() == 2);
    REQUIRE(list.contains("trusted.com"));
    REQUIRE(list.contains("example.com"));
    REQUIRE_FALSE(list.contains("Trusted.com"));
    REQUIRE_FALSE(list.contains("trusted.co"));
    REQUIRE_FALSE(list.contains(""));
}

TEST_CASE("AllowList entries are sorted", "[security][allowlist]") {
    AllowList list(std::vector<std::string>{"ygi.li", "example.com", "trusted.com"});

    REQUIRE(list.entries() == std::vector<std::string>{"example.com", "trusted.com", "ygi.li"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Reference Scenarios
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Listed host is allowed", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const auto result = validator.inspect("http://trusted.com/page");

    REQUIRE(result.allowed());
    REQUIRE(result.reason == DenyReason::None);
    REQUIRE(result.hostname == "trusted.com");
    REQUIRE(validator.classify("http://trusted.com/page") == Verdict::Allow);
}

TEST_CASE("Unlisted host is denied", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const auto result = validator.inspect("http://malicious.com");

    REQUIRE(result.verdict == Verdict::Deny);
    REQUIRE(result.reason == DenyReason::UnauthorizedHost);
    REQUIRE(result.hostname == "malicious.com");
}

TEST_CASE("Text that is not a URL is denied", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const auto result = validator.inspect("not a url");

    REQUIRE(result.verdict == Verdict::Deny);
    REQUIRE(result.reason == DenyReason::MalformedUrl);
    REQUIRE(result.hostname.empty());
}

TEST_CASE("Empty candidate is denied without parsing", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const auto result = validator.inspect("");

    REQUIRE(result.verdict == Verdict::Deny);
    REQUIRE(result.reason == DenyReason::MissingInput);
}

TEST_CASE("Allowed host as a prefix of another host is denied", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    REQUIRE(validator.classify("http://trusted.com.evil.com") == Verdict::Deny);
    REQUIRE(validator.classify("http://trusted.com.evil.com/page") == Verdict::Deny);
}

TEST_CASE("Uppercase http host is lowercased by the parser", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const auto result = validator.inspect("HTTP://TRUSTED.COM");

    REQUIRE(result.hostname == "trusted.com");
    REQUIRE(result.allowed());
}

// ═══════════════════════════════════════════════════════════════════════════
// Lookalike Hosts
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Substring, subdomain and superstring hosts are denied", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const std::vector<std::string> lookalikes = {
        "http://evil-trusted.com/",
        "http://sub.trusted.com/",
        "http://trusted.co/",
        "http://rusted.com/",
        "http://trusted.com.example.org/",
        "https://example.com.attacker.net/login",
    };

    for (const auto& url : lookalikes) {
        INFO(url);
        const auto result = validator.inspect(url);
        REQUIRE(result.verdict == Verdict::Deny);
        REQUIRE(result.reason == DenyReason::UnauthorizedHost);
    }
}

TEST_CASE("Userinfo does not decide the host", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    REQUIRE(validator.inspect("http://trusted.com@evil.com/").hostname == "evil.com");
    REQUIRE(validator.classify("http://trusted.com@evil.com/") == Verdict::Deny);
    REQUIRE(validator.classify("http://user:pw@trusted.com/") == Verdict::Allow);
}

TEST_CASE("Trailing dot host is denied under exact matching", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const auto result = validator.inspect("http://trusted.com./page");

    REQUIRE(result.hostname == "trusted.com.");
    REQUIRE(result.reason == DenyReason::UnauthorizedHost);
}

TEST_CASE("Port does not affect the hostname", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    REQUIRE(validator.classify("http://trusted.com:8080/x") == Verdict::Allow);
    REQUIRE(validator.classify("https://example.com:443/") == Verdict::Allow);
    REQUIRE(validator.classify("http://malicious.com:80/") == Verdict::Deny);
}

// ═══════════════════════════════════════════════════════════════════════════
// Parse Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Relative references are not absolute URLs", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const std::vector<std::string> relatives = {
        "/page",
        "page.html",
        "//evil.com/",
        "?url=http://trusted.com",
        "trusted.com",
        "http://",
    };

    for (const auto& candidate : relatives) {
        INFO(candidate);
        REQUIRE(validator.inspect(candidate).reason == DenyReason::MalformedUrl);
    }
}

TEST_CASE("URLs without a host are denied", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    auto script = validator.inspect("javascript:alert(1)");
    REQUIRE(script.verdict == Verdict::Deny);
    REQUIRE(script.reason == DenyReason::UnauthorizedHost);

    auto mail = validator.inspect("mailto:admin@trusted.com");
    REQUIRE(mail.verdict == Verdict::Deny);
    REQUIRE(mail.hostname.empty());
}

TEST_CASE("Binary garbage is denied", "[security][validator]") {
    RedirectValidator validator(demo_policy());

    const char raw[] = "\x00\xff\xfe http://trusted.com";
    const std::string garbage(raw, sizeof(raw) - 1);
    REQUIRE(validator.classify(garbage) == Verdict::Deny);
}

TEST_CASE("Empty allow-list denies everything", "[security][validator]") {
    RedirectValidator validator(RedirectPolicy{});

    REQUIRE(validator.classify("http://trusted.com/") == Verdict::Deny);
    REQUIRE(validator.classify("https://example.com/") == Verdict::Deny);
}

// ═══════════════════════════════════════════════════════════════════════════
// Policy Options
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Any scheme is accepted when no schemes are configured", "[security][validator][policy]") {
    RedirectValidator validator(demo_policy());

    REQUIRE(validator.classify("ftp://trusted.com/file") == Verdict::Allow);
}

TEST_CASE("Scheme restriction denies other schemes", "[security][validator][policy]") {
    auto policy = demo_policy();
    policy.allowed_schemes = {"https"};
    RedirectValidator validator(policy);

    REQUIRE(validator.classify("https://trusted.com/") == Verdict::Allow);
    REQUIRE(validator.inspect("http://trusted.com/").reason == DenyReason::DisallowedScheme);
    REQUIRE(validator.inspect("ftp://trusted.com/").reason == DenyReason::DisallowedScheme);
}

TEST_CASE("Canonical matching ignores case and a trailing dot", "[security][validator][policy]") {
    auto policy = demo_policy();
    policy.host_matching = HostMatching::Canonical;
    RedirectValidator validator(policy);

    REQUIRE(validator.classify("http://trusted.com./page") == Verdict::Allow);
    REQUIRE(validator.classify("myapp://TRUSTED.COM/cb") == Verdict::Allow);
    REQUIRE(validator.classify("http://trusted.com.evil.com/") == Verdict::Deny);
}

TEST_CASE("Canonical matching normalizes allow-list entries too", "[security][validator][policy]") {
    RedirectPolicy policy;
    policy.allowed_hosts = AllowList{"Trusted.COM."};
    policy.host_matching = HostMatching::Canonical;
    RedirectValidator validator(policy);

    REQUIRE(validator.classify("http://trusted.com/") == Verdict::Allow);
}

TEST_CASE("Exact matching keeps opaque host case", "[security][validator][policy]") {
    RedirectValidator validator(demo_policy());

    REQUIRE(validator.classify("myapp://TRUSTED.COM/cb") == Verdict::Deny);
    REQUIRE(validator.classify("myapp://trusted.com/cb") == Verdict::Allow);
}

TEST_CASE("Disabled enforcement allows any non-empty candidate", "[security][validator][policy]") {
    auto policy = demo_policy();
    policy.enforce_allow_list = false;
    RedirectValidator validator(policy);

    REQUIRE(validator.classify("http://malicious.com") == Verdict::Allow);
    REQUIRE(validator.classify("not a url") == Verdict::Allow);
    REQUIRE(validator.classify("") == Verdict::Deny);
}

TEST_CASE("canonical_host lowercases and strips one trailing dot", "[security][validator]") {
    REQUIRE(detail::canonical_host("Trusted.COM.") == "trusted.com");
    REQUIRE(detail::canonical_host("trusted.com") == "trusted.com");
    REQUIRE(detail::canonical_host(".") == ".");
}

TEST_CASE("Verdict and reason names", "[security][validator]") {
    REQUIRE(to_string(Verdict::Allow) == "ALLOW");
    REQUIRE(to_string(Verdict::Deny) == "DENY");
    REQUIRE(to_string(DenyReason::UnauthorizedHost) == "unauthorized_host");
    REQUIRE(to_string(DenyReason::MissingInput) == "missing_input");
}
