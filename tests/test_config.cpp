#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include "../config/Config.hpp"
#include "network/HttpFetcher.hpp"

using namespace WebCrawl;

namespace {

std::filesystem::path FreshDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // anonymous namespace

TEST_CASE("Config keeps defaults for missing keys") {
    Config config;
    config.FromJson(nlohmann::json{{"workers", 12}, {"follow_behavior", "any"}, {"seed_urls", {"example.com", 5}}});

    CHECK(config.workers == 12);
    CHECK(config.follow_behavior == "any");
    CHECK(config.max_urls == 100);
    CHECK(config.queue_size == 10000);
    CHECK(config.http_user_agent == "WebCrawlBot/1.0");
    REQUIRE(config.seed_urls.size() == 1);
    CHECK(config.seed_urls[0] == "example.com");
}

TEST_CASE("Config::Load appends missing keys and keeps a backup") {
    auto dir = FreshDir("webcrawl_config_test");
    auto path = dir / "config.json";
    {
        std::ofstream o(path);
        o << R"({"max_urls": 7, "custom": true})";
    }

    Config config;
    config.Load(path.string());
    CHECK(config.max_urls == 7);
    CHECK(config.workers == 5);

    std::ifstream f(path);
    auto written = nlohmann::json::parse(f);
    CHECK(written["max_urls"] == 7);
    CHECK(written["custom"] == true);
    CHECK(written.contains("cache_ttl_minutes"));
    CHECK(std::filesystem::exists(dir / "config.json.bak"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Config::CreateDefault writes a loadable file") {
    auto dir = FreshDir("webcrawl_config_default_test");
    auto path = dir / "nested" / "config.json";

    Config().CreateDefault(path.string());
    Config loaded;
    loaded.Load(path.string());
    CHECK(loaded.follow_behavior == "same-host");
    CHECK(loaded.cache_enabled);
    CHECK_FALSE(std::filesystem::exists(dir / "nested" / "config.json.bak"));

    CHECK_THROWS_AS(loaded.Load((dir / "missing.json").string()), std::runtime_error);
    std::filesystem::remove_all(dir);
}

TEST_CASE("HttpFetcherOptions follow the http config keys") {
    Config config;
    config.http_timeout_ms = 1500;
    config.http_max_redirects = 2;
    config.http_user_agent = "TestAgent/2.0";
    config.max_html_bytes = 4096;

    auto options = HttpFetcherOptions::FromConfig(config);
    CHECK(options.timeout_ms == 1500);
    CHECK(options.max_redirects == 2);
    CHECK(options.user_agent == "TestAgent/2.0");
    CHECK(options.max_body_bytes == 4096);
    CHECK(options.default_headers.count("Accept") == 1);
    CHECK(options.default_headers.count("User-Agent") == 0);

    config.use_browser_headers = false;
    CHECK(HttpFetcherOptions::FromConfig(config).default_headers.empty());
}
