// src/scheduler.cpp

#include "scheduler.h"

#include <syslog.h>
#include <exception>
#include <stdexcept>
#include <vector>

namespace GridLink {

ThreadScheduler::ThreadScheduler() {
    running_ = true;
    thread_ = std::thread(&ThreadScheduler::run_loop, this);
}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

TaskId ThreadScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            throw std::runtime_error("Scheduler stopped");
        }

        id = next_id_++;
        queue_.emplace(Clock::now() + delay, Entry{id, std::move(task)});
    }

    queue_cv_.notify_all();
    return id;
}

bool ThreadScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->second.id == id) {
            queue_.erase(it);
            return true;
        }
    }

    return false;
}

size_t ThreadScheduler::pending() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return;
        running_ = false;
    }

    queue_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    // Drain: deferred closes must still happen
    std::vector<Entry> remaining;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (auto& [when, entry] : queue_) {
            remaining.push_back(std::move(entry));
        }
        queue_.clear();
    }

    if (!remaining.empty()) {
        syslog(LOG_INFO, "Scheduler stopping, running %zu pending tasks", remaining.size());
    }

    for (const auto& entry : remaining) {
        run_task(entry);
    }
}

void ThreadScheduler::run_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    while (running_) {
        if (queue_.empty()) {
            queue_cv_.wait(lock, [this]() {
                return !running_ || !queue_.empty();
            });
            continue;
        }

        auto next = queue_.begin();
        if (Clock::now() < next->first) {
            queue_cv_.wait_until(lock, next->first);
            continue;
        }

        Entry entry = std::move(next->second);
        queue_.erase(next);

        lock.unlock();
        run_task(entry);
        lock.lock();
    }
}

void ThreadScheduler::run_task(const Entry& entry) {
    try {
        entry.task();
    } catch (const std::exception& e) {
        syslog(LOG_ERR, "Scheduled task %llu failed: %s",
               static_cast<unsigned long long>(entry.id), e.what());
    }
}

} // namespace GridLink
