#pragma once
#include <string>
#include <vector>
#include "../interfaces/IFetcher.hpp"

namespace WebCrawl {
    class LinkExtractor {
    public:
        // Every <a href> in document order, href as written and the anchor
        // text with whitespace collapsed. Unparseable markup yields no links.
        static std::vector<Link> Extract(const std::string& html_content);
    };
}
