#include "FollowPolicy.hpp"
#include "utils/UrlUtil.hpp"

namespace WebCrawl {
namespace FollowPolicy {

namespace {

// Returns the last two labels ("example.com"), or an empty string for hosts
// with fewer than two labels.
std::string BaseDomain(const std::string& host) {
    auto last = host.rfind('.');
    if (last == std::string::npos) return {};
    if (last == 0) return {};
    auto prev = host.rfind('.', last - 1);
    if (prev == std::string::npos) return host;
    return host.substr(prev + 1);
}

} // anonymous namespace

bool AreRelatedHosts(const std::string& host_a, const std::string& host_b) {
    std::string base_a = BaseDomain(host_a);
    std::string base_b = BaseDomain(host_b);
    if (base_a.empty() || base_b.empty()) return false;
    return base_a == base_b;
}

bool Admit(const std::string& page_url, const std::string& candidate_url, FollowBehavior behavior) {
    switch (behavior) {
        case FollowBehavior::None:
            return false;
        case FollowBehavior::Any:
            return true;
        case FollowBehavior::SameHost: {
            auto page_host = UrlUtil::GetHost(page_url);
            auto candidate_host = UrlUtil::GetHost(candidate_url);
            return page_host && candidate_host && *page_host == *candidate_host;
        }
        case FollowBehavior::RelatedSubdomains: {
            auto page_host = UrlUtil::GetHostname(page_url);
            auto candidate_host = UrlUtil::GetHostname(candidate_url);
            return page_host && candidate_host && AreRelatedHosts(*page_host, *candidate_host);
        }
    }
    return false;
}

std::optional<FollowBehavior> FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) {
        char lc = (c >= 'A' && c <= 'Z') ? char(c + 32) : char(c);
        t.push_back(lc == '_' ? '-' : lc);
    }
    if (t == "none") return FollowBehavior::None;
    if (t == "any") return FollowBehavior::Any;
    if (t == "same-host" || t == "same-domain") return FollowBehavior::SameHost;
    if (t == "related-subdomains") return FollowBehavior::RelatedSubdomains;
    return std::nullopt;
}

const char* ToString(FollowBehavior behavior) {
    switch (behavior) {
        case FollowBehavior::None:              return "none";
        case FollowBehavior::Any:               return "any";
        case FollowBehavior::SameHost:          return "same-host";
        case FollowBehavior::RelatedSubdomains: return "related-subdomains";
    }
    return "none";
}

}
}
