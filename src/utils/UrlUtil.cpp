#include "UrlUtil.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace WebCrawl {
namespace UrlUtil {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
    void operator()(char* s) const { curl_free(s); }
};
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

inline std::string Trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

inline bool StartsWithNoCase(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    if (s.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != pfx[i]) return false;
    }
    return true;
}

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
// Returns the lowercase scheme, or an empty string when there is none.
std::string ExtractScheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return {};
    for (size_t i = 1; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == ':') return ToLower(s.substr(0, i));
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return {};
    }
    return {};
}

std::optional<std::string> GetPart(CURLU* h, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(h, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return std::nullopt;
    }
    CurlString owned(raw);
    return std::string(owned.get());
}

CurlUrlPtr ParseAbsolute(const std::string& url) {
    CurlUrlPtr h(curl_url());
    if (!h) return nullptr;
    if (curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return nullptr;
    }
    return h;
}

} // anonymous namespace

std::optional<std::string> NormalizeUrl(const std::string& raw) {
    std::string value = Trim(raw);
    if (value.empty()) return std::nullopt;

    auto sep = value.find("://");
    if (sep == std::string::npos) {
        value = "https://" + value;
    } else {
        std::string scheme = ExtractScheme(value);
        if (scheme.size() != sep) return std::nullopt; // e.g. "ht tp://"
        if (scheme == "http") {
            value = "https" + value.substr(sep);
        } else if (scheme != "https") {
            return std::nullopt;
        }
    }

    CurlUrlPtr h = ParseAbsolute(value);
    if (!h) return std::nullopt;

    auto host = GetPart(h.get(), CURLUPART_HOST);
    if (!host || host->empty()) return std::nullopt;

    curl_url_set(h.get(), CURLUPART_QUERY, nullptr, 0);
    curl_url_set(h.get(), CURLUPART_FRAGMENT, nullptr, 0);

    auto out = GetPart(h.get(), CURLUPART_URL);
    if (!out) return std::nullopt;

    auto path = GetPart(h.get(), CURLUPART_PATH);
    if ((!path || *path == "/" || path->empty()) && !out->empty() && out->back() == '/') {
        out->pop_back();
    }
    return out;
}

std::optional<std::string> ResolveLink(const std::string& page_domain, const std::string& raw_link) {
    std::string link = Trim(raw_link);
    auto hash = link.find('#');
    if (hash != std::string::npos) link.erase(hash);

    std::string scheme = ExtractScheme(link);
    if (!scheme.empty()) {
        if (scheme != "http" && scheme != "https") return std::nullopt;
        return NormalizeUrl(link);
    }

    std::string base = page_domain;
    if (!StartsWithNoCase(base, "http://") && !StartsWithNoCase(base, "https://")) {
        base = "https://" + base;
    }

    CurlUrlPtr h = ParseAbsolute(base);
    if (!h) return std::nullopt;

    if (!link.empty()) {
        // With a URL already in the handle, a relative URL resolves against it.
        if (curl_url_set(h.get(), CURLUPART_URL, link.c_str(), 0) != CURLUE_OK) {
            return std::nullopt;
        }
    }

    auto resolved = GetPart(h.get(), CURLUPART_URL);
    if (!resolved) return std::nullopt;
    return NormalizeUrl(*resolved);
}

std::optional<std::string> GetHost(const std::string& url) {
    CurlUrlPtr h = ParseAbsolute(url);
    if (!h) return std::nullopt;
    auto host = GetPart(h.get(), CURLUPART_HOST);
    if (!host || host->empty()) return std::nullopt;
    // CURLUPART_PORT only reports a port that was written in the URL.
    if (auto port = GetPart(h.get(), CURLUPART_PORT)) {
        return *host + ":" + *port;
    }
    return host;
}

std::optional<std::string> GetHostname(const std::string& url) {
    CurlUrlPtr h = ParseAbsolute(url);
    if (!h) return std::nullopt;
    auto host = GetPart(h.get(), CURLUPART_HOST);
    if (!host || host->empty()) return std::nullopt;
    return host;
}

std::vector<std::string> ReadUrlFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open url file: " + path);
    }
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(f, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;
        urls.push_back(std::move(line));
    }
    return urls;
}

}
}
