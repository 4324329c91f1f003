#include "MetadataPageParser.hpp"
#include "../core/Errors.hpp"

namespace WebCrawl {

std::any MetadataPageParser::Parse(const FetchResponse& page) {
    if (page.html.empty()) {
        throw ParseError("empty page: " + page.url);
    }
    auto metadata = MetadataParser::Parse(page.html);
    if (!metadata) {
        throw ParseError("no metadata found: " + page.url);
    }
    return *metadata;
}

}
