// include/scheduler.h
// Deferred-action scheduler used to time-box discovery windows

#ifndef GRIDLINK_SCHEDULER_H
#define GRIDLINK_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace GridLink {

using TaskId = uint64_t;

class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /**
     * Run task once after delay. Never blocks the caller.
     */
    virtual TaskId schedule_after(std::chrono::milliseconds delay, Task task) = 0;

    /**
     * Remove a task that has not started yet
     * @return false if the task already ran or is unknown
     */
    virtual bool cancel(TaskId id) = 0;
};

/**
 * Scheduler with one background worker thread.
 *
 * stop() (and the destructor) runs every still-pending task immediately on
 * the calling thread, so deferred resource release is never dropped.
 */
class ThreadScheduler : public Scheduler {
private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        TaskId id;
        Task task;
    };

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::multimap<Clock::time_point, Entry> queue_;
    TaskId next_id_ = 1;

public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TaskId id) override;

    void stop();

    bool is_running() const {
        return running_;
    }

    size_t pending();

private:
    void run_loop();
    static void run_task(const Entry& entry);
};

} // namespace GridLink

#endif // GRIDLINK_SCHEDULER_H
