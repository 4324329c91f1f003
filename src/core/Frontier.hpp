#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace WebCrawl {

    enum class AdmitMode {
        Blocking,    // wait for room; used for seeds
        NonBlocking  // drop when full; used for discovered links
    };

    enum class AdmitResult {
        Admitted,
        Duplicate,
        Dropped,
        Closed
    };

    // Deduplicating set of every URL admitted during a run plus the bounded
    // FIFO of URLs waiting for a worker.
    //
    // The seen set never shrinks: its memory is proportional to the number of
    // distinct URLs admitted, which a run bounds through max_urls. A URL that
    // was dropped because the queue was full stays in the seen set and is not
    // admitted again.
    class Frontier {
    public:
        explicit Frontier(size_t capacity);

        Frontier(const Frontier&) = delete;
        Frontier& operator=(const Frontier&) = delete;

        AdmitResult Admit(const std::string& url, AdmitMode mode);

        // Blocks until a URL is available or the frontier is closed.
        // Every URL returned must be matched by a call to Finish().
        std::optional<std::string> Next();
        void Finish();

        // Wakes every blocked caller; Next() returns std::nullopt from then on.
        void Close();

        // No queued URLs and no URL between Next() and Finish().
        bool IsIdle() const;
        bool IsClosed() const;

        size_t PendingCount() const;
        size_t SeenCount() const;
        size_t ActiveCount() const;
        size_t Capacity() const { return capacity_; }

    private:
        // Insert-if-absent. The only gate for admission.
        bool MarkSeen(const std::string& url);

        const size_t capacity_;

        mutable std::mutex seen_mutex_;
        std::unordered_set<std::string> seen_;

        mutable std::mutex queue_mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<std::string> pending_;
        size_t active_ = 0;
        bool closed_ = false;
    };
}
