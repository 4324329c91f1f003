#pragma once
#include <string>
#include <optional>

namespace WebCrawl {
    struct Metadata {
        std::string title;
        std::string image_url;
        std::string description;
        std::string site_name;
        std::string canonical_url;
        std::string language;
    };

    class MetadataParser {
    public:
        // Returns std::nullopt when the markup cannot be parsed or carries none
        // of title, description, image or site name.
        static std::optional<Metadata> Parse(const std::string& html_content);
    };
}
