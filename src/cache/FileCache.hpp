#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "../interfaces/ICache.hpp"

namespace WebCrawl {
    // Stores each value in its own file under a directory, so cached pages
    // survive between runs. File names are derived from a hash of the key;
    // the key itself is stored as the first line and checked on read.
    class FileCache : public ICache {
    public:
        // Creates the directory if needed. Throws std::runtime_error on failure.
        explicit FileCache(const std::string& dir);

        std::optional<std::string> Get(const std::string& key) override;
        void Set(const std::string& key, const std::string& value) override;

        std::filesystem::path PathFor(const std::string& key) const;

    private:
        std::filesystem::path dir_;
        std::mutex write_mutex_;
    };
}
