#pragma once
#include <optional>
#include <string>

namespace WebCrawl {

    enum class FollowBehavior {
        None,
        Any,
        SameHost,
        RelatedSubdomains
    };

    namespace FollowPolicy {

        // Whether a link discovered on page_url may be queued.
        bool Admit(const std::string& page_url, const std::string& candidate_url, FollowBehavior behavior);

        // True when both hosts share their last two dot-separated labels.
        // Single-label hosts such as "localhost" never match.
        bool AreRelatedHosts(const std::string& host_a, const std::string& host_b);

        // Accepts "none", "any", "same-host", "same-domain", "related-subdomains"
        // and their underscore spellings.
        std::optional<FollowBehavior> FromString(const std::string& s);
        const char* ToString(FollowBehavior behavior);

    }
}
