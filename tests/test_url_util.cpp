#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include "utils/UrlUtil.hpp"

using namespace WebCrawl;

TEST_CASE("NormalizeUrl canonicalizes scheme, root path and query") {
    using UrlUtil::NormalizeUrl;

    CHECK(NormalizeUrl("example.com") == std::optional<std::string>("https://example.com"));
    CHECK(NormalizeUrl("https://example.com/") == std::optional<std::string>("https://example.com"));
    CHECK(NormalizeUrl("http://example.com") == std::optional<std::string>("https://example.com"));
    CHECK(NormalizeUrl("https://example.com/path?q=1#section") == std::optional<std::string>("https://example.com/path"));
    CHECK(NormalizeUrl("  https://example.com/docs  ") == std::optional<std::string>("https://example.com/docs"));
    CHECK(NormalizeUrl("https://example.com/a/b/") == std::optional<std::string>("https://example.com/a/b/"));
}

TEST_CASE("NormalizeUrl rejects empty and non-web URLs") {
    using UrlUtil::NormalizeUrl;

    CHECK_FALSE(NormalizeUrl("").has_value());
    CHECK_FALSE(NormalizeUrl("   ").has_value());
    CHECK_FALSE(NormalizeUrl("ftp://example.com").has_value());
    CHECK_FALSE(NormalizeUrl("ht tp://example.com").has_value());
}

TEST_CASE("NormalizeUrl is idempotent") {
    for (const char* raw : {"example.com", "http://example.com/a?x=y", "https://example.com:8443/p"}) {
        auto once = UrlUtil::NormalizeUrl(raw);
        REQUIRE(once.has_value());
        CHECK(UrlUtil::NormalizeUrl(*once) == once);
    }
}

TEST_CASE("ResolveLink handles absolute, relative and protocol-relative links") {
    using UrlUtil::ResolveLink;

    CHECK(ResolveLink("example.com", "/page") == std::optional<std::string>("https://example.com/page"));
    CHECK(ResolveLink("example.com", "about") == std::optional<std::string>("https://example.com/about"));
    CHECK(ResolveLink("https://example.com", "/page") == std::optional<std::string>("https://example.com/page"));
    CHECK(ResolveLink("example.com", "https://other.com/x?y=1") == std::optional<std::string>("https://other.com/x"));
    CHECK(ResolveLink("example.com", "http://other.com/x") == std::optional<std::string>("https://other.com/x"));
    CHECK(ResolveLink("example.com", "//cdn.example.com/a.jpg") == std::optional<std::string>("https://cdn.example.com/a.jpg"));
    CHECK(ResolveLink("example.com", "/page#top") == std::optional<std::string>("https://example.com/page"));
    CHECK(ResolveLink("example.com", "https://x.com/p#frag") == std::optional<std::string>("https://x.com/p"));
    CHECK(ResolveLink("localhost:8080", "/a") == std::optional<std::string>("https://localhost:8080/a"));
}

TEST_CASE("ResolveLink rejects other schemes") {
    using UrlUtil::ResolveLink;

    CHECK_FALSE(ResolveLink("example.com", "mailto:someone@example.com").has_value());
    CHECK_FALSE(ResolveLink("example.com", "javascript:void(0)").has_value());
    CHECK_FALSE(ResolveLink("example.com", "ftp://example.com/file").has_value());
}

TEST_CASE("ResolveLink maps a fragment-only link to the domain root") {
    CHECK(UrlUtil::ResolveLink("example.com", "#top") == std::optional<std::string>("https://example.com"));
}

TEST_CASE("GetHost keeps an explicit port, GetHostname drops it") {
    CHECK(UrlUtil::GetHost("https://example.com/a") == std::optional<std::string>("example.com"));
    CHECK(UrlUtil::GetHost("https://example.com:8080/a") == std::optional<std::string>("example.com:8080"));
    CHECK(UrlUtil::GetHostname("https://example.com:8080/a") == std::optional<std::string>("example.com"));
    CHECK_FALSE(UrlUtil::GetHost("not a url").has_value());
}

TEST_CASE("ReadUrlFile skips blanks and comments") {
    auto path = std::filesystem::temp_directory_path() / "webcrawl_test_seeds.txt";
    {
        std::ofstream o(path);
        o << "# seeds\n";
        o << "https://example.com\n";
        o << "\n";
        o << "   example.org  \n";
    }
    auto urls = UrlUtil::ReadUrlFile(path.string());
    std::filesystem::remove(path);

    REQUIRE(urls.size() == 2);
    CHECK(urls[0] == "https://example.com");
    CHECK(urls[1] == "example.org");

    CHECK_THROWS_AS(UrlUtil::ReadUrlFile((std::filesystem::temp_directory_path() / "webcrawl_missing.txt").string()), std::runtime_error);
}
