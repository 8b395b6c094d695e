#pragma once

#include "chunkscribe/system_state.hpp"

#include <chrono>
#include <string>

namespace chunkscribe {

// Wall-clock timer; elapsed_seconds() may be read any number of times.
class ScopedTimer {
public:
    ScopedTimer() : start_(std::chrono::steady_clock::now()) {}

    double elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Prometheus text exposition of counters, worker states and summary gauges.
std::string export_prometheus(const StateSnapshot& snapshot);

// One line on the metrics logger per finished transcription / merge.
void log_transcription_metric(const std::string& segment, const std::string& model,
                              double audio_minutes, double seconds);
void log_process_metric(const std::string& group, double total_seconds);

} // namespace chunkscribe
