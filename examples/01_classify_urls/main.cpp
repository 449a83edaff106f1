// Example 01: Classifying Redirect Destinations
//
// Runs candidate URLs through a RedirectValidator and prints the verdict,
// the internal deny reason and the parsed hostname for each one.
//
// Usage: example_classify_urls [--allow host]... [--canonical] [url]...

#include <redirguard/http/redirect_handler.hpp>
#include <redirguard/http/request_parser.hpp>
#include <redirguard/security/redirect_validator.hpp>
#include <redirguard/security/uri_encoding.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace redirguard;

int main(int argc, char* argv[]) {
    std::vector<std::string> hosts;
    std::vector<std::string> candidates;
    bool canonical = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--allow" && i + 1 < argc) {
            hosts.emplace_back(argv[++i]);
        } else if (arg == "--canonical") {
            canonical = true;
        } else {
            candidates.push_back(std::move(arg));
        }
    }

    if (hosts.empty()) {
        hosts = {"trusted.com", "example.com", "ygi.li"};
    }
    if (candidates.empty()) {
        candidates = {
            "http://trusted.com",
            "https://example.com/path?q=1",
            "http://malicious.com",
            "http://trusted.com.evil.com",
            "http://trusted.com@evil.com",
            "http://trusted.com\\@evil.com",
            "HTTP://TRUSTED.COM",
            "http://trusted.com.",
            "//trusted.com",
            "javascript:alert(1)",
            "not a url",
            "",
        };
    }

    std::cout << "=== Redirect Destination Classification ===\n\n";

    // 1. Build the policy
    security::RedirectPolicy policy;
    policy.allowed_hosts = security::AllowList(hosts);
    policy.host_matching = canonical ? security::HostMatching::Canonical : security::HostMatching::Exact;

    std::cout << "Allow-list (" << (canonical ? "canonical" : "exact") << " matching):";
    for (const auto& host : policy.allowed_hosts.entries()) {
        std::cout << " " << host;
    }
    std::cout << "\n\n";

    // 2. Classify every candidate
    const security::RedirectValidator validator(policy);
    for (const auto& candidate : candidates) {
        const auto result = validator.inspect(candidate);
        std::cout << std::left << std::setw(36) << ("'" + candidate + "'")
                  << " " << std::setw(5) << security::to_string(result.verdict);
        if (!result.allowed()) {
            std::cout << " reason=" << security::to_string(result.reason);
        }
        if (!result.hostname.empty()) {
            std::cout << " host=" << result.hostname;
        }
        std::cout << "\n";
    }

    // 3. What the HTTP route answers for the first candidate
    const http::RedirectHandler handler(validator);
    const auto request = http::parse_request_head(
        "GET /redirect?url=" + security::encode_uri_component(candidates.front()) + " HTTP/1.1\r\n\r\n");
    if (!request) {
        std::cerr << "ERROR: " << request.error().message << "\n";
        return 1;
    }
    const auto response = handler.handle(*request);
    std::cout << "\nGET /redirect?url=<first candidate> -> " << response.status_code;
    if (const auto location = response.get_header("Location")) {
        std::cout << " Location: " << *location;
    } else {
        std::cout << " " << response.body;
    }
    std::cout << "\n";

    return 0;
}
