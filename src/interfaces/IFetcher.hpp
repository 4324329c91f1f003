#pragma once
#include <map>
#include <string>
#include <vector>

namespace WebCrawl {

struct Link {
    std::string url;
    std::string text;
};

struct FetchRequest {
    std::string url;
    std::string fetcher = "http"; // selects a fetcher implementation
    std::map<std::string, std::string> headers;
    long timeout_ms = 0;          // 0 = fetcher default
};

struct FetchResponse {
    std::string url;
    long status_code = 0;
    std::map<std::string, std::string> headers;
    std::string html;
    std::vector<Link> links;
};

class IFetcher {
public:
    virtual ~IFetcher() = default;
    // Synchronous. Throws FetchError on transport or content failures.
    virtual FetchResponse Fetch(const FetchRequest& request) = 0;
};

}
