#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace WebCrawl {

// Shared, thread-safe cancellation flag. Copies refer to the same state.
class CancellationToken {
    struct State;

public:
    // Keeps an OnCancel callback registered until destroyed or Reset().
    // Reset() waits for a callback that is currently running on another thread.
    class Registration {
    public:
        Registration() = default;
        ~Registration();

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void Reset();

    private:
        friend class CancellationToken;
        Registration(std::shared_ptr<State> state, uint64_t id);

        std::shared_ptr<State> state_;
        uint64_t id_ = 0;
    };

    CancellationToken();

    // Idempotent. Wakes every waiter and runs registered callbacks once.
    void Cancel();
    bool IsCancelled() const;

    // Returns true if cancelled before the timeout elapsed.
    bool WaitFor(std::chrono::milliseconds timeout) const;

    // Runs fn on the cancelling thread. If the token is already cancelled,
    // fn runs immediately on the calling thread.
    Registration OnCancel(std::function<void()> fn) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        uint64_t next_id = 1;
        std::map<uint64_t, std::function<void()>> callbacks;
        // Held while callbacks run so Registration::Reset can wait them out.
        std::mutex callback_mutex;
    };

    std::shared_ptr<State> state_;
};

}
