#include "Frontier.hpp"

namespace WebCrawl {

Frontier::Frontier(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool Frontier::MarkSeen(const std::string& url) {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    return seen_.insert(url).second;
}

AdmitResult Frontier::Admit(const std::string& url, AdmitMode mode) {
    if (!MarkSeen(url)) {
        return AdmitResult::Duplicate;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (mode == AdmitMode::Blocking) {
        not_full_.wait(lock, [this] { return closed_ || pending_.size() < capacity_; });
    }
    if (closed_) {
        return AdmitResult::Closed;
    }
    if (pending_.size() >= capacity_) {
        return AdmitResult::Dropped;
    }
    pending_.push_back(url);
    lock.unlock();
    not_empty_.notify_one();
    return AdmitResult::Admitted;
}

std::optional<std::string> Frontier::Next() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !pending_.empty(); });
    if (closed_) {
        return std::nullopt;
    }
    std::string url = std::move(pending_.front());
    pending_.pop_front();
    ++active_;
    lock.unlock();
    not_full_.notify_one();
    return url;
}

void Frontier::Finish() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (active_ > 0) --active_;
}

void Frontier::Close() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool Frontier::IsIdle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return pending_.empty() && active_ == 0;
}

bool Frontier::IsClosed() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return closed_;
}

size_t Frontier::PendingCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return pending_.size();
}

size_t Frontier::SeenCount() const {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    return seen_.size();
}

size_t Frontier::ActiveCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return active_;
}

}
