#pragma once
#include "../interfaces/IPageParser.hpp"
#include "MetadataParser.hpp"

namespace WebCrawl {

// IPageParser producing a Metadata value from the page markup.
class MetadataPageParser : public IPageParser {
public:
    std::any Parse(const FetchResponse& page) override;
};

}
