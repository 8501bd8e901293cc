#pragma once

#include "TaskScheduler.h"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Records scheduled tasks; tests fire them explicitly.
 */
class FakeScheduler : public TaskScheduler {
public:
    struct Entry {
        std::string label;
        unsigned int delayMs;
        std::function<void()> fn;
        bool fired = false;
    };

    bool schedule(const std::string& label, unsigned int delayMs,
                  std::function<void()> fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) return false;
        entries_.push_back(Entry{label, delayMs, std::move(fn), false});
        return true;
    }

    void SetAccepting(bool accepting) {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = accepting;
    }

    // Fire every unfired task once, in scheduling order
    size_t RunAll() {
        std::vector<std::function<void()>> due;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& entry : entries_) {
                if (!entry.fired) {
                    entry.fired = true;
                    due.push_back(entry.fn);
                }
            }
        }
        for (auto& fn : due) fn();
        return due.size();
    }

    std::vector<Entry> Entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::vector<Entry> EntriesMatching(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Entry> result;
        for (const auto& entry : entries_) {
            if (entry.label.compare(0, prefix.size(), prefix) == 0) result.push_back(entry);
        }
        return result;
    }

    size_t Count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    bool accepting_ = true;
};
