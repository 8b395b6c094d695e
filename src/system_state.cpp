#include "chunkscribe/system_state.hpp"

#include "chunkscribe/error.hpp"

namespace chunkscribe {

namespace {

template<typename T>
void push_bounded(std::deque<T>& ring, T value, std::size_t capacity) {
    ring.push_back(std::move(value));
    while (ring.size() > capacity) {
        ring.pop_front();
    }
}

} // namespace

const char* to_string(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::Idle: return "idle";
        case WorkerStatus::Waiting: return "waiting";
        case WorkerStatus::Processing: return "processing";
        case WorkerStatus::Error: return "error";
    }
    return "unknown";
}

SystemState::SystemState(std::size_t sample_capacity, std::size_t event_capacity)
    : sample_capacity_(sample_capacity), event_capacity_(event_capacity) {
    CHUNKSCRIBE_CHECK_ARGUMENT(sample_capacity_ > 0, "sample capacity must be positive");
    CHUNKSCRIBE_CHECK_ARGUMENT(event_capacity_ > 0, "event capacity must be positive");
}

void SystemState::register_worker(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = workers_[name];
    state.last_update = std::chrono::system_clock::now();
}

void SystemState::update_worker(const std::string& name, WorkerStatus status, const std::string& current_item) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = workers_[name];
    state.status = status;
    state.current_item = current_item;
    state.last_update = std::chrono::system_clock::now();
}

void SystemState::set_queue_size(const std::string& name, std::size_t queue_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = workers_[name];
    state.queue_size = queue_size;
    state.last_update = std::chrono::system_clock::now();
}

void SystemState::record_transcription(const std::string& model, double audio_minutes,
                                       double transcription_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_bounded(transcriptions_,
                 TranscriptionSample{model, audio_minutes, transcription_seconds, std::chrono::system_clock::now()},
                 sample_capacity_);
}

void SystemState::record_process(const std::string& group, double total_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_bounded(processes_, ProcessSample{group, total_seconds, std::chrono::system_clock::now()},
                 sample_capacity_);
}

void SystemState::record_event(const NotificationEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_bounded(events_, EventRecord{event, std::chrono::system_clock::now()}, event_capacity_);
}

void SystemState::increment_files_processed() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.files_processed;
}

void SystemState::increment_groups_merged() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.groups_merged;
}

void SystemState::increment_transcription_failures() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.transcription_failures;
}

void SystemState::increment_dead_lettered() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.segments_dead_lettered;
}

WorkerState SystemState::worker(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(name);
    return it == workers_.end() ? WorkerState{} : it->second;
}

std::map<std::string, WorkerState> SystemState::workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_;
}

Counters SystemState::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

MetricsSummary SystemState::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_locked();
}

std::vector<TranscriptionSample> SystemState::transcription_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {transcriptions_.begin(), transcriptions_.end()};
}

std::vector<ProcessSample> SystemState::process_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {processes_.begin(), processes_.end()};
}

std::vector<EventRecord> SystemState::recent_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {events_.begin(), events_.end()};
}

StateSnapshot SystemState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StateSnapshot snap;
    snap.workers = workers_;
    snap.counters = counters_;
    snap.summary = summary_locked();
    snap.recent_events.assign(events_.begin(), events_.end());
    return snap;
}

MetricsSummary SystemState::summary_locked() const {
    MetricsSummary summary;
    summary.transcription_samples = transcriptions_.size();
    summary.process_samples = processes_.size();

    std::map<std::string, std::pair<double, double>> totals;   // model -> (seconds, minutes)
    for (const auto& sample : transcriptions_) {
        auto& entry = totals[sample.model];
        entry.first += sample.transcription_seconds;
        entry.second += sample.audio_minutes;
    }
    for (const auto& [model, entry] : totals) {
        if (entry.second > 0.0) {
            summary.seconds_per_audio_minute[model] = entry.first / entry.second;
        }
    }

    if (!processes_.empty()) {
        double total = 0.0;
        for (const auto& sample : processes_) {
            total += sample.total_seconds;
        }
        summary.average_process_seconds = total / static_cast<double>(processes_.size());
    }
    return summary;
}

} // namespace chunkscribe
