#pragma once

#include "chunkscribe/notifier.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chunkscribe {

enum class WorkerStatus {
    Idle,
    Waiting,
    Processing,
    Error
};

const char* to_string(WorkerStatus status);

struct WorkerState {
    WorkerStatus status = WorkerStatus::Idle;
    std::string current_item;
    std::size_t queue_size = 0;
    std::chrono::system_clock::time_point last_update{};
};

struct TranscriptionSample {
    std::string model;
    double audio_minutes = 0.0;
    double transcription_seconds = 0.0;
    std::chrono::system_clock::time_point at{};
};

struct ProcessSample {
    std::string group;
    double total_seconds = 0.0;
    std::chrono::system_clock::time_point at{};
};

struct EventRecord {
    NotificationEvent event;
    std::chrono::system_clock::time_point at{};
};

struct Counters {
    uint64_t files_processed = 0;
    uint64_t groups_merged = 0;
    uint64_t transcription_failures = 0;
    uint64_t segments_dead_lettered = 0;
};

struct MetricsSummary {
    std::map<std::string, double> seconds_per_audio_minute;   // per model
    double average_process_seconds = 0.0;
    std::size_t transcription_samples = 0;
    std::size_t process_samples = 0;
};

struct StateSnapshot {
    std::map<std::string, WorkerState> workers;
    Counters counters;
    MetricsSummary summary;
    std::vector<EventRecord> recent_events;   // oldest first
};

/**
 * Worker status records, counters, timing samples and recent events.
 *
 * One coarse mutex guards everything. Writers are the discovery workers,
 * readers are status surfaces taking copies through the getters.
 */
class SystemState {
public:
    explicit SystemState(std::size_t sample_capacity = 1000, std::size_t event_capacity = 100);

    void register_worker(const std::string& name);
    void update_worker(const std::string& name, WorkerStatus status, const std::string& current_item = "");
    void set_queue_size(const std::string& name, std::size_t queue_size);

    void record_transcription(const std::string& model, double audio_minutes, double transcription_seconds);
    void record_process(const std::string& group, double total_seconds);
    void record_event(const NotificationEvent& event);

    void increment_files_processed();
    void increment_groups_merged();
    void increment_transcription_failures();
    void increment_dead_lettered();

    WorkerState worker(const std::string& name) const;
    std::map<std::string, WorkerState> workers() const;
    Counters counters() const;
    MetricsSummary summary() const;
    std::vector<TranscriptionSample> transcription_samples() const;
    std::vector<ProcessSample> process_samples() const;
    std::vector<EventRecord> recent_events() const;
    StateSnapshot snapshot() const;

private:
    MetricsSummary summary_locked() const;

    const std::size_t sample_capacity_;
    const std::size_t event_capacity_;

    mutable std::mutex mutex_;
    std::map<std::string, WorkerState> workers_;
    Counters counters_;
    std::deque<TranscriptionSample> transcriptions_;
    std::deque<ProcessSample> processes_;
    std::deque<EventRecord> events_;
};

} // namespace chunkscribe
