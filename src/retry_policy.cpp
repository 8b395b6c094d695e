#include "chunkscribe/retry_policy.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/logging.hpp"

#include <algorithm>

namespace chunkscribe {

const char* to_string(RetryDecision decision) {
    switch (decision) {
        case RetryDecision::Proceed: return "proceed";
        case RetryDecision::Backoff: return "backoff";
        case RetryDecision::DeadLettered: return "dead-lettered";
    }
    return "unknown";
}

RetryTracker::RetryTracker(RetryConfig config) : config_(config) {
    CHUNKSCRIBE_CHECK_ARGUMENT(config_.max_attempts > 0, "retry.max_attempts must be positive");
}

std::chrono::seconds RetryTracker::backoff_for(uint32_t failures) const {
    if (failures == 0) {
        return std::chrono::seconds(0);
    }
    uint64_t delay = config_.initial_backoff_seconds;
    for (uint32_t i = 1; i < failures && delay < config_.max_backoff_seconds; ++i) {
        delay *= 2;
    }
    return std::chrono::seconds(std::min<uint64_t>(delay, config_.max_backoff_seconds));
}

RetryDecision RetryTracker::check(const std::string& segment, std::filesystem::file_time_type modified,
                                  Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(segment);
    if (it == entries_.end()) {
        return RetryDecision::Proceed;
    }
    if (it->second.modified != modified) {
        LOG_INFO("Segment ", segment, " changed on disk; retry history cleared");
        entries_.erase(it);
        return RetryDecision::Proceed;
    }
    if (it->second.dead) {
        return RetryDecision::DeadLettered;
    }
    return now < it->second.next_attempt ? RetryDecision::Backoff : RetryDecision::Proceed;
}

bool RetryTracker::record_failure(const std::string& segment, std::filesystem::file_time_type modified,
                                  Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[segment];
    if (entry.modified != modified) {
        entry = Entry{};
        entry.modified = modified;
    }
    if (entry.dead) {
        return false;
    }

    ++entry.failures;
    if (entry.failures >= config_.max_attempts) {
        entry.dead = true;
        LOG_ERROR("Segment ", segment, " dead-lettered after ", entry.failures, " failed attempts");
        return true;
    }

    const auto delay = backoff_for(entry.failures);
    entry.next_attempt = now + delay;
    LOG_WARNING("Segment ", segment, " failed (attempt ", entry.failures, "/", config_.max_attempts,
                "); next attempt in ", delay.count(), "s");
    return false;
}

void RetryTracker::record_success(const std::string& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(segment);
}

uint32_t RetryTracker::failures(const std::string& segment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(segment);
    return it == entries_.end() ? 0 : it->second.failures;
}

std::vector<std::string> RetryTracker::dead_letters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [segment, entry] : entries_) {
        if (entry.dead) result.push_back(segment);
    }
    return result;
}

} // namespace chunkscribe
