#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "cache/FileCache.hpp"
#include "cache/MemoryCache.hpp"
#include "core/Crawler.hpp"
#include "core/PeriodicTask.hpp"
#include "network/HttpFetcher.hpp"
#include "parser/MetadataPageParser.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtil.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void HandleSignal(int) {
    g_interrupted.store(true);
}

nlohmann::json PageRecord(const WebCrawl::FetchRequest& req, const std::any& parsed, const std::optional<WebCrawl::PageError>& error) {
    nlohmann::json record;
    record["url"] = req.url;
    if (error) {
        record["error"] = error->message;
        record["error_kind"] = WebCrawl::ToString(error->kind);
    }
    if (const auto* meta = std::any_cast<WebCrawl::Metadata>(&parsed)) {
        record["metadata"] = {
            {"title", meta->title},
            {"description", meta->description},
            {"image_url", meta->image_url},
            {"site_name", meta->site_name},
            {"canonical_url", meta->canonical_url},
            {"language", meta->language},
        };
    }
    return record;
}

int Fail(const std::string& message) {
    WebCrawl::Logger::Log(WebCrawl::LogLevel::Error, message);
    curl_global_cleanup();
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        WebCrawl::Logger::Log(WebCrawl::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    // Load Config
    try {
        WebCrawl::Config::GetInstance().Load(config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            WebCrawl::Logger::Log(WebCrawl::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                WebCrawl::Config::GetInstance().CreateDefault(config_path_str);
                WebCrawl::Logger::Log(WebCrawl::LogLevel::Info, "Default config.json created. Review it, add seed_urls, and run again.");
                curl_global_cleanup();
                return 0;
            } catch (const std::exception& create_e) {
                return Fail("Failed to create default config: " + std::string(create_e.what()));
            }
        }
        return Fail("Failed to load config: " + error_message);
    } catch (const nlohmann::json::exception& e) {
        return Fail("Failed to parse config " + config_path_str + ": " + e.what());
    }
    const auto& config = WebCrawl::Config::GetInstance();

    WebCrawl::Logger::Init(exe_dir.string(), WebCrawl::Logger::FromString(config.log_level));
    WebCrawl::Logger::Log(WebCrawl::LogLevel::Info, "Configuration loaded from: " + config_path_str);

    // Seeds: arguments, then config, then seed file
    std::vector<std::string> seeds;
    for (int i = 1; i < argc; ++i) {
        seeds.emplace_back(argv[i]);
    }
    seeds.insert(seeds.end(), config.seed_urls.begin(), config.seed_urls.end());
    if (!config.seed_file.empty()) {
        try {
            auto items = WebCrawl::UrlUtil::ReadUrlFile(config.seed_file);
            seeds.insert(seeds.end(), items.begin(), items.end());
        } catch (const std::runtime_error& e) {
            return Fail("Failed to read seed file: " + std::string(e.what()));
        }
    }
    if (seeds.empty()) {
        return Fail("No seed URLs. Pass URLs as arguments or set seed_urls / seed_file in " + config_path_str);
    }

    auto follow = WebCrawl::FollowPolicy::FromString(config.follow_behavior);
    if (!follow) {
        return Fail("Invalid follow_behavior: " + config.follow_behavior);
    }

    // Setup Core Components
    WebCrawl::CrawlerOptions options;
    options.max_urls = config.max_urls;
    options.workers = config.workers;
    options.request_delay = std::chrono::milliseconds(config.request_delay_ms);
    options.queue_size = config.queue_size;
    options.follow_behavior = *follow;
    options.show_progress = config.show_progress;
    options.progress_interval = std::chrono::seconds(config.progress_interval_seconds);
    options.idle_check_interval = std::chrono::milliseconds(config.idle_check_interval_ms);
    options.fetcher = std::make_shared<WebCrawl::HttpFetcher>(WebCrawl::HttpFetcherOptions::FromConfig(config));
    options.parsers.SetDefaultParser(std::make_shared<WebCrawl::MetadataPageParser>());

    if (config.cache_enabled) {
        if (config.cache_dir.empty()) {
            options.cache = std::make_shared<WebCrawl::MemoryCache>(config.cache_max_size, config.cache_ttl_minutes);
        } else {
            try {
                options.cache = std::make_shared<WebCrawl::FileCache>(config.cache_dir);
            } catch (const std::runtime_error& e) {
                return Fail(e.what());
            }
        }
    }

    std::unique_ptr<WebCrawl::Crawler> crawler;
    try {
        crawler = std::make_unique<WebCrawl::Crawler>(std::move(options));
    } catch (const std::invalid_argument& e) {
        return Fail("Invalid crawler configuration: " + std::string(e.what()));
    }

    std::ofstream output;
    if (!config.output_file.empty()) {
        output.open(config.output_file, std::ios::out | std::ios::app);
        if (!output.is_open()) {
            return Fail("Could not open output file: " + config.output_file);
        }
    }
    std::mutex output_mutex;

    auto on_page = [&](const WebCrawl::FetchRequest& req, const std::any& parsed, const std::optional<WebCrawl::PageError>& error) {
        if (error && error->kind == WebCrawl::PageErrorKind::FetchError) {
            WebCrawl::Logger::Log(WebCrawl::LogLevel::Error, "Failed to crawl", {{"url", req.url}, {"error", error->message}});
        } else {
            std::string title;
            if (const auto* meta = std::any_cast<WebCrawl::Metadata>(&parsed)) title = meta->title;
            WebCrawl::Logger::Log(WebCrawl::LogLevel::Info, "Crawled", {{"url", req.url}, {"title", title}});
        }
        if (output.is_open()) {
            std::lock_guard<std::mutex> lock(output_mutex);
            output << PageRecord(req, parsed, error).dump() << '\n';
        }
    };

    // SIGINT / SIGTERM stop the crawl after in-flight pages finish.
    WebCrawl::CancellationToken cancel;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    WebCrawl::PeriodicTask signal_watch("signal-watch", std::chrono::milliseconds(200), [&cancel] {
        if (g_interrupted.load() && !cancel.IsCancelled()) {
            WebCrawl::Logger::Log(WebCrawl::LogLevel::Warn, "Interrupted, stopping crawl");
            cancel.Cancel();
        }
    });
    signal_watch.Start();

    const auto start = std::chrono::steady_clock::now();
    int exit_code = 0;
    try {
        crawler->Crawl(seeds, on_page, cancel);
    } catch (const WebCrawl::CrawlError& e) {
        WebCrawl::Logger::Log(WebCrawl::LogLevel::Error, "Crawling failed: " + std::string(e.what()));
        exit_code = 1;
    }
    signal_watch.Stop();

    const auto& stats = crawler->GetStats();
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    const auto processed = stats.GetProcessed();
    std::printf("\nCrawling completed in %.2fs\n", seconds);
    std::printf("Total URLs processed: %lld\n", static_cast<long long>(processed));
    std::printf("Successful: %lld\n", static_cast<long long>(stats.GetSucceeded()));
    std::printf("Failed: %lld\n", static_cast<long long>(stats.GetFailed()));
    std::printf("Average rate: %.2f pages/second\n", seconds > 0 ? static_cast<double>(processed) / seconds : 0.0);

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}
