#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include "cache/FileCache.hpp"
#include "cache/MemoryCache.hpp"
#include "core/Errors.hpp"

using namespace WebCrawl;

TEST_CASE("MemoryCache LRU eviction") {
    MemoryCache cache(1, /*ttl_minutes=*/10);
    cache.Set("https://a", "<html>A</html>");
    cache.Set("https://b", "<html>B</html>"); // evicts A
    auto ga = cache.Get("https://a");
    auto gb = cache.Get("https://b");
    CHECK_FALSE(ga.has_value());
    REQUIRE(gb.has_value());
    CHECK(*gb == "<html>B</html>");
}

TEST_CASE("MemoryCache Get refreshes recency") {
    MemoryCache cache(2, 10);
    cache.Set("https://a", "A");
    cache.Set("https://b", "B");
    REQUIRE(cache.Get("https://a").has_value());
    cache.Set("https://c", "C"); // evicts B, the least recently used
    CHECK(cache.Get("https://a").has_value());
    CHECK_FALSE(cache.Get("https://b").has_value());
    CHECK(cache.Get("https://c").has_value());
    CHECK(cache.Size() == 2);
}

TEST_CASE("MemoryCache overwrites and expires entries") {
    MemoryCache cache(4, 10);
    cache.Set("https://a", "old");
    cache.Set("https://a", "new");
    CHECK(cache.Get("https://a") == std::optional<std::string>("new"));
    CHECK(cache.Size() == 1);

    MemoryCache expired(4, 0); // zero ttl: entries expire immediately
    expired.Set("https://a", "A");
    CHECK_FALSE(expired.Get("https://a").has_value());
}

TEST_CASE("MemoryCache with no capacity reports write errors") {
    MemoryCache cache(0, 10);
    CHECK_THROWS_AS(cache.Set("https://a", "A"), CacheWriteError);
    CHECK_FALSE(cache.Get("https://a").has_value());
}

TEST_CASE("FileCache persists values across instances") {
    auto dir = std::filesystem::temp_directory_path() / "webcrawl_file_cache_test";
    std::filesystem::remove_all(dir);

    {
        FileCache cache(dir.string());
        CHECK_FALSE(cache.Get("https://example.com").has_value());
        cache.Set("https://example.com", "<html>cached</html>");
        CHECK(cache.Get("https://example.com") == std::optional<std::string>("<html>cached</html>"));
        CHECK(cache.PathFor("https://example.com") != cache.PathFor("https://example.com/other"));
    }

    FileCache reopened(dir.string());
    CHECK(reopened.Get("https://example.com") == std::optional<std::string>("<html>cached</html>"));
    CHECK(std::filesystem::exists(reopened.PathFor("https://example.com")));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileCache ignores a file written for a different key") {
    auto dir = std::filesystem::temp_directory_path() / "webcrawl_file_cache_collision_test";
    std::filesystem::remove_all(dir);

    FileCache cache(dir.string());
    cache.Set("https://example.com/a", "<html>a</html>");

    // Same file name, other key: what a hash collision leaves on disk.
    {
        std::ofstream o(cache.PathFor("https://example.com/a"), std::ios::binary | std::ios::trunc);
        o << "https://example.com/other\n<html>other</html>";
    }
    CHECK_FALSE(cache.Get("https://example.com/a").has_value());

    cache.Set("https://example.com/a", "");
    CHECK(cache.Get("https://example.com/a") == std::optional<std::string>(""));
    CHECK_THROWS_AS(cache.Set("https://example.com/\nbad", "x"), CacheWriteError);

    std::filesystem::remove_all(dir);
}
