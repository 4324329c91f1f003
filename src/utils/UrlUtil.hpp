#pragma once
#include <optional>
#include <string>
#include <vector>

namespace WebCrawl {
namespace UrlUtil {

// Canonicalize a URL into the key used for crawl deduplication.
// Rules, applied in order:
// - Trim surrounding whitespace; an empty result is invalid.
// - A scheme:// prefix other than http or https is invalid.
// - Without a scheme:// prefix, https:// is prepended.
// - http:// is rewritten to https://.
// - Query string and fragment are removed.
// - A bare root path ("/") is dropped.
// Returns std::nullopt when the input is not a valid URL.
std::optional<std::string> NormalizeUrl(const std::string& raw);

// Resolve a link found on a page into an absolute, normalized URL.
// - The fragment is discarded.
// - Absolute links are accepted only for http and https.
// - Relative and protocol-relative links resolve against page_domain, which
//   is used as an https:// base when it carries no scheme of its own.
// Returns std::nullopt for rejected schemes and anything that fails to parse.
std::optional<std::string> ResolveLink(const std::string& page_domain, const std::string& raw_link);

// host[:port] exactly as written in the URL (port only when explicit).
std::optional<std::string> GetHost(const std::string& url);

// Host without port.
std::optional<std::string> GetHostname(const std::string& url);

// Read one URL per line. Blank lines and lines starting with '#' are skipped.
// Throws std::runtime_error when the file cannot be opened.
std::vector<std::string> ReadUrlFile(const std::string& path);

}
}
