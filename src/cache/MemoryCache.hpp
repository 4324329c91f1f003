#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include "../interfaces/ICache.hpp"

namespace WebCrawl {
    // In-process LRU cache of page bodies with a per-entry time to live.
    class MemoryCache : public ICache {
    public:
        MemoryCache(size_t max_size, int ttl_minutes);
        std::optional<std::string> Get(const std::string& key) override;
        void Set(const std::string& key, const std::string& value) override;
        size_t Size();

    private:
        struct CacheEntry {
            std::string key;
            std::string value;
            std::chrono::steady_clock::time_point expiry_time;
        };

        // NOTE: Expiry is enforced lazily within Get/Set. No explicit sweep is required.

        size_t max_size_;
        std::chrono::minutes ttl_;
        std::list<CacheEntry> cache_list_;
        std::unordered_map<std::string, decltype(cache_list_.begin())> cache_map_;
        std::mutex cache_mutex_;
    };
}
