#pragma once
#include <stdexcept>
#include <string>

namespace WebCrawl {

// Per-page failures. Reported through the page callback or the log, never
// thrown out of a crawl run.
enum class PageErrorKind {
    InvalidUrl,
    FetchError,
    ParseError,
    CacheWriteError
};

struct PageError {
    PageErrorKind kind;
    std::string message;
};

inline const char* ToString(PageErrorKind kind) {
    switch (kind) {
        case PageErrorKind::InvalidUrl:      return "invalid_url";
        case PageErrorKind::FetchError:      return "fetch_error";
        case PageErrorKind::ParseError:      return "parse_error";
        case PageErrorKind::CacheWriteError: return "cache_write_error";
    }
    return "unknown";
}

// Thrown by IFetcher implementations.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& message) : std::runtime_error(message) {}
};

// Thrown by IPageParser implementations.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

// Thrown by ICache::Set.
class CacheWriteError : public std::runtime_error {
public:
    explicit CacheWriteError(const std::string& message) : std::runtime_error(message) {}
};

// Run-level failures thrown by Crawler::Crawl.
class CrawlError : public std::runtime_error {
public:
    explicit CrawlError(const std::string& message) : std::runtime_error(message) {}
};

class AlreadyRunningError : public CrawlError {
public:
    AlreadyRunningError() : CrawlError("crawler is already running") {}
};

class CrawlCancelledError : public CrawlError {
public:
    CrawlCancelledError() : CrawlError("crawl cancelled before any url was queued") {}
};

}
