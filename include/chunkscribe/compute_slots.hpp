#pragma once

#include "chunkscribe/error.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <set>

namespace chunkscribe {

// Counting gate bounding how many transcriptions run at once, one slot per
// physical compute resource. When a slot frees up, the waiter with the
// highest priority goes first; equal priorities are served in no set order.
class ComputeSlots {
public:
    explicit ComputeSlots(std::size_t capacity) : capacity_(capacity) {
        CHUNKSCRIBE_CHECK_ARGUMENT(capacity_ > 0, "compute slot capacity must be positive");
    }

    class Lease {
    public:
        Lease(ComputeSlots& slots, int priority) : slots_(&slots) { slots_->acquire(priority); }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { slots_->release(); }

    private:
        ComputeSlots* slots_;
    };

    std::size_t in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

    std::size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    void acquire(int priority) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ticket = waiting_.insert(priority);
        cv_.wait(lock, [this, priority] {
            return in_use_ < capacity_ && priority >= *waiting_.rbegin();
        });
        waiting_.erase(ticket);
        ++in_use_;
        if (in_use_ < capacity_ && !waiting_.empty()) {
            cv_.notify_all();
        }
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_use_;
        }
        cv_.notify_all();
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multiset<int> waiting_;
    std::size_t in_use_ = 0;
};

} // namespace chunkscribe
