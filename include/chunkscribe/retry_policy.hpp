#pragma once

#include "chunkscribe/config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chunkscribe {

enum class RetryDecision {
    Proceed,
    Backoff,
    DeadLettered
};

const char* to_string(RetryDecision decision);

/**
 * Failed-transcription bookkeeping per segment path.
 *
 * After the n-th failure the segment waits min(initial * 2^(n-1), max)
 * seconds. The max_attempts-th failure dead-letters it until its file
 * changes (new modification time). In-memory only.
 */
class RetryTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit RetryTracker(RetryConfig config);

    RetryDecision check(const std::string& segment, std::filesystem::file_time_type modified,
                        Clock::time_point now = Clock::now());

    // Returns true when this failure dead-letters the segment.
    bool record_failure(const std::string& segment, std::filesystem::file_time_type modified,
                        Clock::time_point now = Clock::now());

    void record_success(const std::string& segment);

    std::chrono::seconds backoff_for(uint32_t failures) const;
    uint32_t failures(const std::string& segment) const;
    std::vector<std::string> dead_letters() const;

private:
    struct Entry {
        uint32_t failures = 0;
        bool dead = false;
        std::filesystem::file_time_type modified{};
        Clock::time_point next_attempt{};
    };

    RetryConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace chunkscribe
