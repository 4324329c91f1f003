#include "Crawler.hpp"
#include "PeriodicTask.hpp"
#include "../parser/LinkExtractor.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <exception>
#include <set>
#include <stdexcept>
#include <thread>

namespace WebCrawl {

// State that lives for exactly one call to Crawl().
struct Crawler::Run {
    Run(size_t queue_size, PageCallback cb) : frontier(queue_size), callback(std::move(cb)) {}

    CancellationToken token;
    Frontier frontier;
    PageCallback callback;
};

namespace {

// Joins the worker threads. Leaving the scope early cancels the run first so
// no worker stays blocked on the frontier.
class WorkerGroup {
public:
    explicit WorkerGroup(CancellationToken token) : token_(std::move(token)) {}
    ~WorkerGroup() {
        token_.Cancel();
        Join();
    }

    void Add(std::thread t) { threads_.push_back(std::move(t)); }

    void Join() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

private:
    CancellationToken token_;
    std::vector<std::thread> threads_;
};

} // anonymous namespace

Crawler::Crawler(CrawlerOptions options) : options_(std::move(options)) {
    if (!options_.fetcher) {
        throw std::invalid_argument("crawler requires a fetcher");
    }
    if (options_.workers < 1) {
        throw std::invalid_argument("crawler requires at least one worker");
    }
    if (options_.max_urls < 1) {
        throw std::invalid_argument("max_urls must be at least 1");
    }
    if (options_.queue_size <= 0) {
        options_.queue_size = kDefaultQueueSize;
    }
    if (options_.show_progress && options_.progress_interval.count() <= 0) {
        options_.progress_interval = std::chrono::seconds(30);
    }
    if (options_.idle_check_interval.count() <= 0) {
        options_.idle_check_interval = std::chrono::seconds(1);
    }
    if (options_.fetcher_name.empty()) {
        options_.fetcher_name = "http";
    }
}

void Crawler::Crawl(const std::vector<std::string>& urls, PageCallback callback, CancellationToken cancel) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw AlreadyRunningError();
    }
    struct RunningReset {
        std::atomic<bool>& flag;
        ~RunningReset() { flag.store(false); }
    } running_reset{running_};

    stats_.Reset();
    Run run(static_cast<size_t>(options_.queue_size), std::move(callback));

    auto close_frontier = run.token.OnCancel([&run] { run.frontier.Close(); });
    auto forward_cancel = cancel.OnCancel([token = run.token]() mutable { token.Cancel(); });

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        current_run_ = &run;
    }
    struct CurrentRunReset {
        Crawler& crawler;
        ~CurrentRunReset() {
            std::lock_guard<std::mutex> lock(crawler.run_mutex_);
            crawler.current_run_ = nullptr;
        }
    } current_run_reset{*this};

    Logger::Log(LogLevel::Info, "crawl started", {
        {"seeds", std::to_string(urls.size())},
        {"workers", std::to_string(options_.workers)},
        {"max_urls", std::to_string(options_.max_urls)},
        {"follow", FollowPolicy::ToString(options_.follow_behavior)},
    });

    WorkerGroup workers(run.token);
    for (int i = 0; i < options_.workers; ++i) {
        workers.Add(std::thread(&Crawler::WorkerLoop, this, std::ref(run), i));
    }

    PeriodicTask progress("progress-reporter", options_.progress_interval, [this, &run] {
        ReportProgress(run);
    });
    if (options_.show_progress) {
        progress.Start();
    }

    size_t queued = EnqueueSeeds(run, urls);
    if (queued == 0) {
        const bool cancelled = run.token.IsCancelled();
        run.token.Cancel();
        workers.Join();
        progress.Stop();
        if (cancelled) {
            Logger::Log(LogLevel::Warn, "crawl cancelled before any url was queued");
            throw CrawlCancelledError();
        }
        Logger::Log(LogLevel::Info, "no seed urls were queued, nothing to crawl");
        return;
    }

    PeriodicTask idle_monitor("idle-monitor", options_.idle_check_interval, [&run] {
        if (run.frontier.IsIdle()) {
            Logger::Log(LogLevel::Info, "no more work available, stopping crawler");
            run.token.Cancel();
        }
    });
    idle_monitor.Start();

    workers.Join();
    idle_monitor.Stop();
    progress.Stop();
    run.token.Cancel();

    Logger::Log(LogLevel::Info, "crawl finished", {
        {"processed", std::to_string(stats_.GetProcessed())},
        {"succeeded", std::to_string(stats_.GetSucceeded())},
        {"failed", std::to_string(stats_.GetFailed())},
        {"seen", std::to_string(run.frontier.SeenCount())},
    });
}

void Crawler::Stop() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (current_run_) {
        current_run_->token.Cancel();
    }
}

size_t Crawler::EnqueueSeeds(Run& run, const std::vector<std::string>& urls) {
    size_t queued = 0;
    for (const auto& raw : urls) {
        auto url = UrlUtil::NormalizeUrl(raw);
        if (!url) {
            Logger::Log(LogLevel::Warn, "invalid seed url", {{"url", raw}});
            continue;
        }
        switch (run.frontier.Admit(*url, AdmitMode::Blocking)) {
            case AdmitResult::Admitted:
                ++queued;
                break;
            case AdmitResult::Duplicate:
                Logger::Log(LogLevel::Debug, "duplicate seed url", {{"url", *url}});
                break;
            case AdmitResult::Dropped:
            case AdmitResult::Closed:
                return queued;
        }
    }
    return queued;
}

bool Crawler::CapReached() const {
    return stats_.GetProcessed() >= static_cast<int64_t>(options_.max_urls);
}

void Crawler::WorkerLoop(Run& run, int worker_id) {
    Logger::Log(LogLevel::Debug, "worker started", {{"worker", std::to_string(worker_id)}});
    while (auto url = run.frontier.Next()) {
        if (CapReached()) {
            run.frontier.Finish();
            Logger::Log(LogLevel::Debug, "max urls reached, stopping crawl", {{"worker", std::to_string(worker_id)}});
            // Closes the frontier, which also releases a seed admission
            // blocked on a full queue.
            run.token.Cancel();
            break;
        }
        try {
            ProcessUrl(run, *url);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "unexpected error processing url", {{"url", *url}, {"error", e.what()}});
        }
        run.frontier.Finish();

        if (options_.request_delay.count() > 0 && run.token.WaitFor(options_.request_delay)) {
            break;
        }
    }
    Logger::Log(LogLevel::Debug, "worker stopped", {{"worker", std::to_string(worker_id)}});
}

void Crawler::ProcessUrl(Run& run, const std::string& url) {
    stats_.IncrementProcessed();

    auto domain = UrlUtil::GetHostname(url);
    if (!domain) {
        Logger::Log(LogLevel::Warn, "invalid url", {{"url", url}});
        return;
    }

    auto deliver = [&run, &url](const FetchRequest& req, const std::any& parsed, const std::optional<PageError>& error) {
        if (!run.callback) return;
        try {
            run.callback(req, parsed, error);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "page callback threw", {{"url", url}, {"error", e.what()}});
        }
    };

    FetchRequest request;
    request.url = url;
    request.fetcher = options_.fetcher_name;

    // 1. Cache
    std::optional<FetchResponse> response;
    if (options_.cache) {
        try {
            if (auto cached = options_.cache->Get(url)) {
                Logger::Log(LogLevel::Debug, "cache hit", {{"url", url}});
                FetchResponse hit;
                hit.url = url;
                hit.html = std::move(*cached);
                hit.links = LinkExtractor::Extract(hit.html);
                response = std::move(hit);
            }
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "cache read failed", {{"url", url}, {"error", e.what()}});
        }
    }

    // 2. Fetch on miss
    if (!response) {
        Logger::Log(LogLevel::Debug, "fetching", {{"url", url}});
        try {
            response = options_.fetcher->Fetch(request);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "fetch failed", {{"url", url}, {"error", e.what()}});
            deliver(request, std::any(), PageError{PageErrorKind::FetchError, e.what()});
            stats_.IncrementFailed();
            return;
        }
        if (options_.cache && !response->html.empty()) {
            try {
                options_.cache->Set(url, response->html);
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Warn, "failed to cache html", {
                    {"url", url},
                    {"kind", ToString(PageErrorKind::CacheWriteError)},
                    {"error", e.what()},
                });
            }
        }
    }

    // 3. Parse
    std::any parsed;
    std::optional<PageError> parse_error;
    if (auto parser = options_.parsers.Find(*domain)) {
        Logger::Log(LogLevel::Debug, "parsing page", {{"url", url}, {"domain", *domain}});
        try {
            parsed = parser->Parse(*response);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "failed to parse", {{"url", url}, {"error", e.what()}});
            parse_error = PageError{PageErrorKind::ParseError, e.what()};
        }
    }

    // 4. Links, callback, expansion. Relative links keep the page's port.
    auto base = UrlUtil::GetHost(url);
    std::vector<std::string> discovered = ExtractUrls(response->links, base ? *base : *domain);
    deliver(request, parsed, parse_error);
    QueueDiscoveredUrls(run, url, discovered);
    stats_.IncrementSucceeded();
}

std::vector<std::string> Crawler::ExtractUrls(const std::vector<Link>& links, const std::string& base_host) const {
    std::set<std::string> unique;
    for (const auto& link : links) {
        if (auto resolved = UrlUtil::ResolveLink(base_host, link.url)) {
            unique.insert(std::move(*resolved));
        }
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

void Crawler::QueueDiscoveredUrls(Run& run, const std::string& page_url, const std::vector<std::string>& urls) {
    if (options_.follow_behavior == FollowBehavior::None || urls.empty()) {
        return;
    }

    size_t admitted = 0;
    size_t dropped = 0;
    for (const auto& candidate : urls) {
        if (CapReached()) {
            break;
        }
        if (!FollowPolicy::Admit(page_url, candidate, options_.follow_behavior)) {
            continue;
        }
        AdmitResult result = run.frontier.Admit(candidate, AdmitMode::NonBlocking);
        if (result == AdmitResult::Admitted) {
            ++admitted;
        } else if (result == AdmitResult::Dropped) {
            ++dropped;
        } else if (result == AdmitResult::Closed) {
            break;
        }
    }

    if (dropped > 0) {
        Logger::Log(LogLevel::Warn, "queue full, dropped discovered urls", {
            {"url", page_url},
            {"dropped", std::to_string(dropped)},
        });
    }
    Logger::Log(LogLevel::Debug, "queued discovered urls", {
        {"url", page_url},
        {"discovered", std::to_string(urls.size())},
        {"queued", std::to_string(admitted)},
    });
}

void Crawler::ReportProgress(const Run& run) const {
    Logger::Log(LogLevel::Info, "crawl progress", {
        {"processed", std::to_string(stats_.GetProcessed())},
        {"succeeded", std::to_string(stats_.GetSucceeded())},
        {"failed", std::to_string(stats_.GetFailed())},
        {"queued", std::to_string(run.frontier.PendingCount())},
        {"active", std::to_string(run.frontier.ActiveCount())},
    });
}

}
