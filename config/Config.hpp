#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace WebCrawl {
    struct Config {
        // Crawl
        int max_urls = 100;
        int workers = 5;
        long request_delay_ms = 0;
        int queue_size = 10000;
        std::string follow_behavior = "same-host";
        bool show_progress = true;
        int progress_interval_seconds = 30;
        long idle_check_interval_ms = 1000;
        std::vector<std::string> seed_urls;
        std::string seed_file;
        std::string output_file;

        // HTTP
        long http_timeout_ms = 30000;
        long http_max_redirects = 5;
        std::string http_user_agent = "WebCrawlBot/1.0";
        bool use_browser_headers = true;
        size_t max_html_bytes = 10485760; // 10MB

        // Cache
        bool cache_enabled = true;
        std::string cache_dir; // empty keeps pages in memory
        size_t cache_max_size = 1000;
        int cache_ttl_minutes = 60;

        std::string log_level = "info";

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        // Throws std::runtime_error when the file cannot be opened and
        // nlohmann::json::exception when it is not valid JSON.
        void Load(const std::string& path);
        void CreateDefault(const std::string& path);

        nlohmann::json ToJson() const;
        void FromJson(const nlohmann::json& data);
    };
}
