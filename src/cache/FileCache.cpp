#include "FileCache.hpp"
#include "../core/Errors.hpp"
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace WebCrawl {

namespace {

// FNV-1a, 64 bit. Stable across runs and platforms, unlike std::hash.
uint64_t Fnv1a(const std::string& s) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string ToHex(uint64_t v) {
    static const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = hex[v & 0xF];
        v >>= 4;
    }
    return out;
}

} // anonymous namespace

FileCache::FileCache(const std::string& dir) : dir_(dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("Could not create cache directory " + dir + ": " + ec.message());
    }
}

std::filesystem::path FileCache::PathFor(const std::string& key) const {
    return dir_ / (ToHex(Fnv1a(key)) + ".html");
}

std::optional<std::string> FileCache::Get(const std::string& key) {
    std::ifstream f(PathFor(key), std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    // First line holds the key; a different key means a hash collision.
    std::string stored_key;
    if (!std::getline(f, stored_key) || stored_key != key) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void FileCache::Set(const std::string& key, const std::string& value) {
    if (key.find('\n') != std::string::npos) {
        throw CacheWriteError("cache key contains a newline");
    }
    const auto path = PathFor(key);
    auto tmp = path;
    tmp += ".tmp";

    std::lock_guard<std::mutex> lock(write_mutex_);
    {
        std::ofstream o(tmp, std::ios::binary | std::ios::trunc);
        if (!o.is_open()) {
            throw CacheWriteError("Could not open cache file for writing: " + tmp.string());
        }
        o << key << '\n';
        o.write(value.data(), static_cast<std::streamsize>(value.size()));
        if (!o.good()) {
            throw CacheWriteError("Failed to write cache file: " + tmp.string());
        }
    }

    // Readers never observe a partially written file.
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw CacheWriteError("Failed to move cache file into place: " + path.string());
    }
}

}
