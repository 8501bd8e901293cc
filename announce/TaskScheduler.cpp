/**
 * @file TaskScheduler.cpp
 * @brief Deferred task scheduler worker
 */

#include "TaskScheduler.h"
#include "LogLevel.h"

#include <algorithm>
#include <exception>

DeferredTaskScheduler::DeferredTaskScheduler() {
    m_workerThread = std::thread([this]() { workerLoop(); });
}

DeferredTaskScheduler::~DeferredTaskScheduler() {
    stop();
}

bool DeferredTaskScheduler::schedule(const std::string& label, unsigned int delayMs,
                                     std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            LOG_WARN("[Scheduler] Rejected " << label << ": scheduler stopped");
            return false;
        }

        Task task;
        task.label = label;
        task.fireAt = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
        task.sequence = m_nextSequence++;
        task.fn = std::move(fn);

        m_queue.push_back(std::move(task));
        std::push_heap(m_queue.begin(), m_queue.end(), Later());
    }
    m_wakeup.notify_one();

    LOG_DEBUG("[Scheduler] " << label << " in " << delayMs << "ms");
    return true;
}

void DeferredTaskScheduler::workerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (m_running) {
        if (m_queue.empty()) {
            m_idle.notify_all();
            m_wakeup.wait(lock, [this]() { return !m_running || !m_queue.empty(); });
            continue;
        }

        // Sleep until the earliest task is due; a new earlier task or stop() wakes us
        auto fireAt = m_queue.front().fireAt;
        if (std::chrono::steady_clock::now() < fireAt) {
            m_wakeup.wait_until(lock, fireAt);
            continue;
        }

        std::pop_heap(m_queue.begin(), m_queue.end(), Later());
        Task task = std::move(m_queue.back());
        m_queue.pop_back();

        m_executing = true;
        lock.unlock();

        LOG_DEBUG("[Scheduler] Firing " << task.label);
        try {
            task.fn();
        } catch (const std::exception& e) {
            LOG_WARN("[Scheduler] Task " << task.label << " threw: " << e.what());
        }
        m_fired.fetch_add(1, std::memory_order_relaxed);

        lock.lock();
        m_executing = false;
    }

    m_idle.notify_all();
}

bool DeferredTaskScheduler::waitUntilIdle(unsigned int timeoutMs) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this]() {
        return !m_running || (m_queue.empty() && !m_executing);
    });
}

void DeferredTaskScheduler::stop() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running && !m_workerThread.joinable()) {
            return;
        }
        m_running = false;
        dropped = m_queue.size();
        m_queue.clear();
    }
    m_wakeup.notify_all();

    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }

    if (dropped > 0) {
        LOG_WARN("[Scheduler] Stopped with " << dropped << " unfired task(s)");
    }
}

size_t DeferredTaskScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}
