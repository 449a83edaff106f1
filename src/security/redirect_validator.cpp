#include "redirguard/security/redirect_validator.hpp"

#include <ada.h>

#include <algorithm>
#include <cctype>

namespace redirguard::security {

namespace detail {

std::string canonical_host(std::string_view host) {
    std::string result(host);
    std::transform(result.begin(), result.end(), result.begin(),
        [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    if (result.size() > 1 && result.back() == '.') {
        result.pop_back();
    }
    return result;
}

}  // namespace detail

namespace {

AllowList canonicalize(const AllowList& list) {
    std::vector<std::string> hosts;
    for (const auto& entry : list.entries()) {
        hosts.push_back(detail::canonical_host(entry));
    }
    return AllowList(hosts);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// AllowList
// ═══════════════════════════════════════════════════════════════════════════

AllowList::AllowList(const std::vector<std::string>& hosts)
    : hosts_(hosts.begin(), hosts.end())
{}

AllowList::AllowList(std::initializer_list<std::string_view> hosts) {
    for (std::string_view host : hosts) {
        hosts_.emplace(host);
    }
}

bool AllowList::contains(std::string_view host) const {
    return hosts_.find(host) != hosts_.end();
}

std::vector<std::string> AllowList::entries() const {
    return {hosts_.begin(), hosts_.end()};
}

// ═══════════════════════════════════════════════════════════════════════════
// RedirectValidator
// ═══════════════════════════════════════════════════════════════════════════

RedirectValidator::RedirectValidator(RedirectPolicy policy)
    : policy_(std::move(policy))
{
    // Canonical matching compares canonical forms on both sides
    if (policy_.host_matching == HostMatching::Canonical) {
        policy_.allowed_hosts = canonicalize(policy_.allowed_hosts);
    }
}

Verdict RedirectValidator::classify(std::string_view candidate) const {
    return inspect(candidate).verdict;
}

Classification RedirectValidator::inspect(std::string_view candidate) const {
    Classification result;

    if (candidate.empty()) {
        result.reason = DenyReason::MissingInput;
        return result;
    }

    if (policy_.enforce_allow_list == false) {
        result.verdict = Verdict::Allow;
        result.reason = DenyReason::None;
        return result;
    }

    // No base URL: relative references fail to parse
    auto parsed = ada::parse<ada::url>(candidate);
    if (!parsed) {
        result.reason = DenyReason::MalformedUrl;
        return result;
    }

    const auto& url = *parsed;
    result.hostname = std::string(url.get_hostname());

    std::string scheme = std::string(url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }
    if (scheme_allowed(scheme) == false) {
        result.reason = DenyReason::DisallowedScheme;
        return result;
    }

    if (host_allowed(result.hostname) == false) {
        result.reason = DenyReason::UnauthorizedHost;
        return result;
    }

    result.verdict = Verdict::Allow;
    result.reason = DenyReason::None;
    return result;
}

bool RedirectValidator::host_allowed(std::string_view hostname) const {
    if (hostname.empty()) {
        return false;
    }
    if (policy_.host_matching == HostMatching::Canonical) {
        return policy_.allowed_hosts.contains(detail::canonical_host(hostname));
    }
    return policy_.allowed_hosts.contains(hostname);
}

bool RedirectValidator::scheme_allowed(std::string_view scheme) const {
    if (policy_.allowed_schemes.empty()) {
        return true;
    }
    return std::find(policy_.allowed_schemes.begin(), policy_.allowed_schemes.end(), scheme)
           != policy_.allowed_schemes.end();
}

}  // namespace redirguard::security
