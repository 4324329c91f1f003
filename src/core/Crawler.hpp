#pragma once
#include <any>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "CancellationToken.hpp"
#include "CrawlStats.hpp"
#include "Errors.hpp"
#include "FollowPolicy.hpp"
#include "Frontier.hpp"
#include "ParserRegistry.hpp"
#include "../interfaces/ICache.hpp"
#include "../interfaces/IFetcher.hpp"

namespace WebCrawl {

    // Called once per processed page, on the worker thread that processed it.
    // Calls from different workers may run concurrently.
    using PageCallback = std::function<void(const FetchRequest& request,
                                            const std::any& parsed,
                                            const std::optional<PageError>& error)>;

    struct CrawlerOptions {
        int max_urls = 100;
        int workers = 1;
        std::chrono::milliseconds request_delay{0};
        int queue_size = 10000;
        FollowBehavior follow_behavior = FollowBehavior::None;
        std::shared_ptr<IFetcher> fetcher;
        std::string fetcher_name = "http";
        std::shared_ptr<ICache> cache;
        ParserRegistry parsers;
        bool show_progress = false;
        std::chrono::milliseconds progress_interval{0}; // 0 = 30s
        std::chrono::milliseconds idle_check_interval{1000};
    };

    class Crawler {
    public:
        static constexpr int kDefaultQueueSize = 10000;

        // Throws std::invalid_argument when fetcher is null, workers < 1 or max_urls < 1.
        explicit Crawler(CrawlerOptions options);

        Crawler(const Crawler&) = delete;
        Crawler& operator=(const Crawler&) = delete;

        // Crawls from the seed URLs until no work remains, every worker has
        // stopped at the max_urls cap, or cancel is cancelled. Blocks until
        // all workers have exited.
        // Throws AlreadyRunningError if a crawl is in progress, and
        // CrawlCancelledError if cancel fired before any seed was queued.
        void Crawl(const std::vector<std::string>& urls, PageCallback callback,
                   CancellationToken cancel = CancellationToken());

        // Cancels the crawl in progress, if any. Callable from any thread.
        void Stop();

        bool IsRunning() const { return running_.load(); }
        const CrawlStats& GetStats() const { return stats_; }
        const CrawlerOptions& GetOptions() const { return options_; }

    private:
        struct Run;

        size_t EnqueueSeeds(Run& run, const std::vector<std::string>& urls);
        void WorkerLoop(Run& run, int worker_id);
        void ProcessUrl(Run& run, const std::string& url);
        std::vector<std::string> ExtractUrls(const std::vector<Link>& links, const std::string& base_host) const;
        void QueueDiscoveredUrls(Run& run, const std::string& page_url, const std::vector<std::string>& urls);
        void ReportProgress(const Run& run) const;
        bool CapReached() const;

        CrawlerOptions options_;
        CrawlStats stats_;
        std::atomic<bool> running_{false};

        std::mutex run_mutex_;
        Run* current_run_ = nullptr;
    };
}
