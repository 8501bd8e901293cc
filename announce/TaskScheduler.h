/**
 * @file TaskScheduler.h
 * @brief Fire-and-forget deferred tasks (restorations, artifact deletion)
 *
 * Each scheduled task fires exactly once and is then dropped. There is no
 * ordering guarantee between tasks scheduled for different devices. Tasks
 * still pending when the scheduler stops are lost.
 */

#ifndef REPLAY2PLAYER_TASK_SCHEDULER_H
#define REPLAY2PLAYER_TASK_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    /**
     * @brief Run fn once, delayMs from now, on the scheduler's thread
     * @return false if the scheduler no longer accepts tasks
     */
    virtual bool schedule(const std::string& label, unsigned int delayMs,
                          std::function<void()> fn) = 0;
};

//=============================================================================
// DeferredTaskScheduler - single worker thread, tasks ordered by fire time
//=============================================================================

class DeferredTaskScheduler : public TaskScheduler {
public:
    DeferredTaskScheduler();
    ~DeferredTaskScheduler();

    // Non-copyable
    DeferredTaskScheduler(const DeferredTaskScheduler&) = delete;
    DeferredTaskScheduler& operator=(const DeferredTaskScheduler&) = delete;

    bool schedule(const std::string& label, unsigned int delayMs,
                  std::function<void()> fn) override;

    /**
     * @brief Block until no task is pending or running
     * @return true if idle, false on timeout
     */
    bool waitUntilIdle(unsigned int timeoutMs);

    /**
     * @brief Stop the worker; unfired tasks are discarded
     */
    void stop();

    size_t pendingCount() const;
    uint64_t firedCount() const { return m_fired.load(std::memory_order_relaxed); }

private:
    struct Task {
        std::string label;
        std::chrono::steady_clock::time_point fireAt;
        uint64_t sequence;
        std::function<void()> fn;
    };

    // Min-heap ordering on (fireAt, sequence)
    struct Later {
        bool operator()(const Task& a, const Task& b) const {
            if (a.fireAt != b.fireAt) return a.fireAt > b.fireAt;
            return a.sequence > b.sequence;
        }
    };

    void workerLoop();

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;      // worker: new task or stop
    std::condition_variable m_idle;        // waitUntilIdle()
    std::vector<Task> m_queue;             // heap
    uint64_t m_nextSequence = 0;
    bool m_running = true;
    bool m_executing = false;
    std::atomic<uint64_t> m_fired{0};
    std::thread m_workerThread;
};

#endif // REPLAY2PLAYER_TASK_SCHEDULER_H
