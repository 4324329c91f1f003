#include <catch2/catch_all.hpp>
#include "core/FollowPolicy.hpp"

using namespace WebCrawl;

TEST_CASE("FollowPolicy admits by behavior") {
    const std::string page = "https://example.com/index";

    SECTION("none admits nothing") {
        CHECK_FALSE(FollowPolicy::Admit(page, "https://example.com/a", FollowBehavior::None));
    }
    SECTION("any admits every host") {
        CHECK(FollowPolicy::Admit(page, "https://other.com/a", FollowBehavior::Any));
    }
    SECTION("same host requires an exact host match") {
        CHECK(FollowPolicy::Admit(page, "https://example.com/a", FollowBehavior::SameHost));
        CHECK_FALSE(FollowPolicy::Admit(page, "https://sub.example.com/a", FollowBehavior::SameHost));
        CHECK_FALSE(FollowPolicy::Admit(page, "https://example.com:8443/a", FollowBehavior::SameHost));
    }
    SECTION("related subdomains share the last two labels") {
        CHECK(FollowPolicy::Admit(page, "https://sub.example.com/a", FollowBehavior::RelatedSubdomains));
        CHECK(FollowPolicy::Admit("https://blog.example.com", "https://shop.example.com", FollowBehavior::RelatedSubdomains));
        CHECK_FALSE(FollowPolicy::Admit(page, "https://example.org/a", FollowBehavior::RelatedSubdomains));
    }
}

TEST_CASE("AreRelatedHosts needs at least two labels") {
    CHECK(FollowPolicy::AreRelatedHosts("a.example.com", "b.example.com"));
    CHECK(FollowPolicy::AreRelatedHosts("example.com", "www.example.com"));
    CHECK_FALSE(FollowPolicy::AreRelatedHosts("localhost", "localhost"));
    CHECK_FALSE(FollowPolicy::AreRelatedHosts("example.com", "example.net"));
}

TEST_CASE("FollowBehavior parses config spellings") {
    CHECK(FollowPolicy::FromString("none") == FollowBehavior::None);
    CHECK(FollowPolicy::FromString("ANY") == FollowBehavior::Any);
    CHECK(FollowPolicy::FromString("same-host") == FollowBehavior::SameHost);
    CHECK(FollowPolicy::FromString("same_domain") == FollowBehavior::SameHost);
    CHECK(FollowPolicy::FromString("related_subdomains") == FollowBehavior::RelatedSubdomains);
    CHECK_FALSE(FollowPolicy::FromString("everything").has_value());

    CHECK(std::string(FollowPolicy::ToString(FollowBehavior::RelatedSubdomains)) == "related-subdomains");
}
