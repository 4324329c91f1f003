#include "MemoryCache.hpp"
#include "../core/Errors.hpp"

namespace WebCrawl {

MemoryCache::MemoryCache(size_t max_size, int ttl_minutes)
    : max_size_(max_size), ttl_(ttl_minutes) {}

std::optional<std::string> MemoryCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_map_.find(key);

    if (it == cache_map_.end()) {
        return std::nullopt; // Not found
    }

    if (std::chrono::steady_clock::now() >= it->second->expiry_time) {
        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return std::nullopt;
    }

    // Most recently used entries live at the front
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->value;
}

void MemoryCache::Set(const std::string& key, const std::string& value) {
    if (max_size_ == 0) {
        throw CacheWriteError("memory cache has zero capacity");
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_map_.find(key);

    if (it != cache_map_.end()) {
        cache_list_.erase(it->second);
        cache_map_.erase(it);
    }

    if (cache_map_.size() >= max_size_ && !cache_list_.empty()) {
        const auto& lru_entry = cache_list_.back();
        cache_map_.erase(lru_entry.key);
        cache_list_.pop_back();
    }

    auto expiry_time = std::chrono::steady_clock::now() + ttl_;
    cache_list_.push_front({key, value, expiry_time});
    cache_map_[key] = cache_list_.begin();
}

size_t MemoryCache::Size() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_map_.size();
}

}
