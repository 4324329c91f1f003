#pragma once
#include <any>
#include "IFetcher.hpp"

namespace WebCrawl {

class IPageParser {
public:
    virtual ~IPageParser() = default;
    // Returns the parsed value for the page. Throws on failure.
    virtual std::any Parse(const FetchResponse& page) = 0;
};

}
