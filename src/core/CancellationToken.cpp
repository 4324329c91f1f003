#include "CancellationToken.hpp"

namespace WebCrawl {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() {
    std::lock_guard<std::mutex> callback_lock(state_->callback_mutex);
    std::map<uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

CancellationToken::Registration CancellationToken::OnCancel(std::function<void()> fn) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(fn));
            return Registration(state_, id);
        }
    }
    fn();
    return Registration();
}

CancellationToken::Registration::Registration(std::shared_ptr<State> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationToken::Registration::~Registration() {
    Reset();
}

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationToken::Registration::Reset() {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> callback_lock(state_->callback_mutex);
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

}
