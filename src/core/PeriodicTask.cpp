#include "PeriodicTask.hpp"
#include "../utils/Logger.hpp"
#include <exception>

namespace WebCrawl {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Job job)
    : name_(std::move(name)), interval_(interval), job_(std::move(job)) {
    if (interval_.count() <= 0) {
        interval_ = std::chrono::milliseconds(1000);
    }
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (thread_.joinable()) return;
    stop_ = false;
    thread_ = std::thread(&PeriodicTask::Run, this);
}

void PeriodicTask::Stop() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void PeriodicTask::Run() {
    Logger::Log(LogLevel::Debug, "Periodic task started: " + name_);
    std::unique_lock<std::mutex> lock(mutex_);
    auto next_run = std::chrono::steady_clock::now() + interval_;
    while (!stop_) {
        // Wait for the stop signal or until the next tick
        if (cv_.wait_until(lock, next_run, [this] { return stop_; })) {
            break;
        }
        next_run += interval_;
        // Unlock while the job runs so Stop() can be requested meanwhile
        lock.unlock();
        try {
            job_();
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Exception in periodic task " + name_ + ": " + std::string(e.what()));
        }
        lock.lock();
    }
    Logger::Log(LogLevel::Debug, "Periodic task stopped: " + name_);
}

}
