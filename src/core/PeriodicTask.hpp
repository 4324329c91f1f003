#pragma once
#include <functional>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include <string>

namespace WebCrawl {
    // Runs a job on its own thread every interval until stopped.
    // The job is not run immediately on Start(), only after the first interval.
    class PeriodicTask {
    public:
        using Job = std::function<void()>;

        PeriodicTask(std::string name, std::chrono::milliseconds interval, Job job);
        ~PeriodicTask();

        PeriodicTask(const PeriodicTask&) = delete;
        PeriodicTask& operator=(const PeriodicTask&) = delete;

        void Start();
        // Safe to call more than once. Must not be called from the job itself.
        void Stop();

    private:
        void Run();

        std::string name_;
        std::chrono::milliseconds interval_;
        Job job_;
        std::mutex mutex_;
        std::condition_variable cv_;
        std::thread thread_;
        bool stop_ = false;
    };
}
