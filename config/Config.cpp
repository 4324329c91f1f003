#include "Config.hpp"
#include "../src/utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace WebCrawl {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["max_urls"] = max_urls;
    data["workers"] = workers;
    data["request_delay_ms"] = request_delay_ms;
    data["queue_size"] = queue_size;
    data["follow_behavior"] = follow_behavior;
    data["show_progress"] = show_progress;
    data["progress_interval_seconds"] = progress_interval_seconds;
    data["idle_check_interval_ms"] = idle_check_interval_ms;
    data["seed_urls"] = seed_urls;
    data["seed_file"] = seed_file;
    data["output_file"] = output_file;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["use_browser_headers"] = use_browser_headers;
    data["max_html_bytes"] = max_html_bytes;
    data["cache_enabled"] = cache_enabled;
    data["cache_dir"] = cache_dir;
    data["cache_max_size"] = cache_max_size;
    data["cache_ttl_minutes"] = cache_ttl_minutes;
    data["log_level"] = log_level;
    return data;
}

void Config::FromJson(const nlohmann::json& data) {
    const Config defaults;
    max_urls = data.value("max_urls", defaults.max_urls);
    workers = data.value("workers", defaults.workers);
    request_delay_ms = data.value("request_delay_ms", defaults.request_delay_ms);
    queue_size = data.value("queue_size", defaults.queue_size);
    follow_behavior = data.value("follow_behavior", defaults.follow_behavior);
    show_progress = data.value("show_progress", defaults.show_progress);
    progress_interval_seconds = data.value("progress_interval_seconds", defaults.progress_interval_seconds);
    idle_check_interval_ms = data.value("idle_check_interval_ms", defaults.idle_check_interval_ms);
    seed_file = data.value("seed_file", defaults.seed_file);
    output_file = data.value("output_file", defaults.output_file);
    http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
    http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
    http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
    use_browser_headers = data.value("use_browser_headers", defaults.use_browser_headers);
    max_html_bytes = data.value("max_html_bytes", defaults.max_html_bytes);
    cache_enabled = data.value("cache_enabled", defaults.cache_enabled);
    cache_dir = data.value("cache_dir", defaults.cache_dir);
    cache_max_size = data.value("cache_max_size", defaults.cache_max_size);
    cache_ttl_minutes = data.value("cache_ttl_minutes", defaults.cache_ttl_minutes);
    log_level = data.value("log_level", defaults.log_level);

    seed_urls.clear();
    if (data.contains("seed_urls") && data["seed_urls"].is_array()) {
        for (const auto& v : data["seed_urls"]) {
            if (v.is_string()) seed_urls.push_back(v.get<std::string>());
        }
    }
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    FromJson(data);

    // Write back missing keys so an existing config.json picks up new options.
    // Unknown keys are preserved; only missing ones are appended.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up config file " + path + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            // Startup continues with the values already loaded.
            Logger::Log(LogLevel::Warn, "Could not update config file with new keys: " + path);
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    nlohmann::json data = defaultConfig.ToJson();

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
