#pragma once

#include "chunkscribe/pipeline.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <string>

namespace chunkscribe {

// Thread-safe FIFO of candidates shared by one worker thread and any number
// of producers. A path already queued is not queued twice; it may be queued
// again once a worker has taken it.
class CandidateQueue {
public:
    // Returns false when the path is already queued or the queue is stopped.
    bool push(Candidate candidate) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        if (!queued_.insert(candidate.segment.string()).second) {
            return false;
        }
        queue_.push_back(std::move(candidate));
        cv_.notify_all();
        return true;
    }

    // Blocks until a candidate is available. Returns false once stopped;
    // candidates still queued then are dropped. Every successful pop must be
    // paired with done().
    bool pop(Candidate& candidate) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (stopped_) {
            return false;
        }
        return take_locked(candidate);
    }

    // Non-blocking variant for synchronous draining.
    bool try_pop(Candidate& candidate) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        return take_locked(candidate);
    }

    void done() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busy_ > 0) --busy_;
        cv_.notify_all();
    }

    // Waits until nothing is queued and nothing is being processed.
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return (queue_.empty() && busy_ == 0) || stopped_; });
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    bool take_locked(Candidate& candidate) {
        candidate = std::move(queue_.front());
        queue_.pop_front();
        queued_.erase(candidate.segment.string());
        ++busy_;
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Candidate> queue_;
    std::set<std::string> queued_;
    std::size_t busy_ = 0;
    bool stopped_ = false;
};

} // namespace chunkscribe
