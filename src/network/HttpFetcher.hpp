#pragma once
#include <string>
#include <map>
#include "../interfaces/IFetcher.hpp"

namespace WebCrawl {

struct Config;

struct HttpFetcherOptions {
    long timeout_ms = 30000;
    long max_redirects = 5;
    std::string user_agent = "WebCrawlBot/1.0";
    size_t max_body_bytes = 10 * 1024 * 1024;
    // Sent with every request unless the request sets the same header.
    std::map<std::string, std::string> default_headers;

    static HttpFetcherOptions FromConfig(const Config& config);
};

// Headers mimicking a desktop browser.
const std::map<std::string, std::string>& BrowserHeaders();

// Synchronous libcurl fetcher. Each call uses its own easy handle, so one
// instance may be shared by all crawl workers. curl_global_init must have
// been called before the first Fetch.
class HttpFetcher : public IFetcher {
public:
    explicit HttpFetcher(HttpFetcherOptions options = {});

    // Non-copyable
    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    FetchResponse Fetch(const FetchRequest& request) override;

private:
    HttpFetcherOptions options_;
};

}
