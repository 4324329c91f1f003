#pragma once
#include <string>
#include <optional>

namespace WebCrawl {

// Byte-oriented page cache keyed by URL.
class ICache {
public:
    virtual ~ICache() = default;
    virtual std::optional<std::string> Get(const std::string& key) = 0;
    // Throws CacheWriteError when the value could not be stored.
    virtual void Set(const std::string& key, const std::string& value) = 0;
};

}
