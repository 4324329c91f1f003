#include "HttpFetcher.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include "../../config/Config.hpp"
#include "../core/Errors.hpp"
#include "../parser/LinkExtractor.hpp"
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string buffer;
    size_t max_bytes = 0;
    bool too_large = false;
    std::map<std::string, std::string> headers;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    if (ctx->buffer.size() + chunk > ctx->max_bytes) {
        ctx->too_large = true;
        return 0; // Aborts the transfer with CURLE_WRITE_ERROR
    }

    try {
        ctx->buffer.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return chunk;
}

std::string TrimAscii(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return total;

    std::string line(buffer, total);
    // A new status line starts a new header block (redirects); keep only the last one.
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->headers.clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos) return total;

    std::string name = TrimAscii(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (!name.empty() && ctx->headers.find(name) == ctx->headers.end()) {
        ctx->headers[name] = TrimAscii(line.substr(colon + 1));
    }
    return total;
}

} // anonymous namespace

namespace WebCrawl {

HttpFetcherOptions HttpFetcherOptions::FromConfig(const Config& config) {
    HttpFetcherOptions options;
    options.timeout_ms = config.http_timeout_ms;
    options.max_redirects = config.http_max_redirects;
    options.user_agent = config.http_user_agent;
    options.max_body_bytes = config.max_html_bytes;
    if (config.use_browser_headers) {
        options.default_headers = BrowserHeaders();
        // The configured user agent wins over the browser one.
        options.default_headers.erase("User-Agent");
    }
    return options;
}

const std::map<std::string, std::string>& BrowserHeaders() {
    static const std::map<std::string, std::string> headers = {
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"Dnt", "1"},
        {"Sec-Fetch-Dest", "document"},
        {"Sec-Fetch-Mode", "navigate"},
        {"Sec-Fetch-Site", "cross-site"},
        {"Upgrade-Insecure-Requests", "1"},
        {"User-Agent", "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:133.0) Gecko/20100101 Firefox/133.0"},
    };
    return headers;
}

HttpFetcher::HttpFetcher(HttpFetcherOptions options) : options_(std::move(options)) {
    if (options_.max_body_bytes == 0) {
        options_.max_body_bytes = 10 * 1024 * 1024;
    }
}

FetchResponse HttpFetcher::Fetch(const FetchRequest& request) {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        throw FetchError("Failed to create cURL easy handle for: " + request.url);
    }

    TransferContext ctx;
    ctx.max_bytes = options_.max_body_bytes;

    const long timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : options_.timeout_ms;

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, ctx.error_buffer);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(h, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    std::map<std::string, std::string> headers = options_.default_headers;
    for (const auto& kv : request.headers) {
        headers[kv.first] = kv.second;
    }
    HeaderList header_list;
    for (const auto& kv : headers) {
        std::string line = kv.first + ": " + kv.second;
        curl_slist* next = curl_slist_append(header_list.get(), line.c_str());
        if (!next) {
            throw FetchError("Failed to build request headers for: " + request.url);
        }
        header_list.release();
        header_list.reset(next);
    }
    if (header_list) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    }

    Logger::Log(LogLevel::Debug, "HTTP GET", {{"url", request.url}});
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        if (ctx.too_large) {
            throw FetchError("response size exceeds limit of " + std::to_string(ctx.max_bytes) + " bytes: " + request.url);
        }
        std::string error = ctx.error_buffer;
        if (error.empty()) {
            error = curl_easy_strerror(rc);
        }
        throw FetchError("Failed to fetch " + request.url + ": " + error);
    }

    FetchResponse response;
    response.url = request.url;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);

    const char* content_type = nullptr;
    curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &content_type);
    std::string type = content_type ? content_type : "";
    if (type.find("text/html") == std::string::npos) {
        throw FetchError("unexpected content type: " + (type.empty() ? std::string("<none>") : type));
    }

    response.headers = std::move(ctx.headers);
    response.html = std::move(ctx.buffer);
    response.links = LinkExtractor::Extract(response.html);
    return response;
}

}
