#pragma once
#include <atomic>
#include <cstdint>

namespace WebCrawl {

    // Counters are independent: a reader may see processed ahead of
    // succeeded + failed while pages are still in flight.
    class CrawlStats {
    public:
        void IncrementProcessed() { processed_.fetch_add(1); }
        void IncrementSucceeded() { succeeded_.fetch_add(1); }
        void IncrementFailed() { failed_.fetch_add(1); }

        int64_t GetProcessed() const { return processed_.load(); }
        int64_t GetSucceeded() const { return succeeded_.load(); }
        int64_t GetFailed() const { return failed_.load(); }

        void Reset() {
            processed_.store(0);
            succeeded_.store(0);
            failed_.store(0);
        }

    private:
        std::atomic<int64_t> processed_{0};
        std::atomic<int64_t> succeeded_{0};
        std::atomic<int64_t> failed_{0};
    };
}
