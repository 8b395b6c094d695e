#include "chunkscribe/metrics.hpp"

#include "chunkscribe/logging.hpp"

#include <iomanip>
#include <sstream>

namespace chunkscribe {

namespace {

std::string escape_label(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') {
            escaped += '\\';
            escaped += c;
        } else if (c == '\n') {
            escaped += "\\n";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

} // namespace

std::string export_prometheus(const StateSnapshot& snapshot) {
    std::ostringstream oss;

    const auto counter = [&oss](const char* name, uint64_t value) {
        oss << "# TYPE " << name << " counter\n";
        oss << name << ' ' << value << "\n\n";
    };
    counter("chunkscribe_files_processed_total", snapshot.counters.files_processed);
    counter("chunkscribe_groups_merged_total", snapshot.counters.groups_merged);
    counter("chunkscribe_transcription_failures_total", snapshot.counters.transcription_failures);
    counter("chunkscribe_segments_dead_lettered_total", snapshot.counters.segments_dead_lettered);

    oss << "# TYPE chunkscribe_worker_queue_size gauge\n";
    for (const auto& [name, state] : snapshot.workers) {
        oss << "chunkscribe_worker_queue_size{worker=\"" << escape_label(name) << "\"} " << state.queue_size << "\n";
    }
    oss << "\n# TYPE chunkscribe_worker_status gauge\n";
    for (const auto& [name, state] : snapshot.workers) {
        oss << "chunkscribe_worker_status{worker=\"" << escape_label(name) << "\",status=\""
            << to_string(state.status) << "\"} 1\n";
    }

    oss << "\n# TYPE chunkscribe_seconds_per_audio_minute gauge\n";
    oss << std::fixed << std::setprecision(6);
    for (const auto& [model, value] : snapshot.summary.seconds_per_audio_minute) {
        oss << "chunkscribe_seconds_per_audio_minute{model=\"" << escape_label(model) << "\"} " << value << "\n";
    }
    oss << "\n# TYPE chunkscribe_average_process_seconds gauge\n";
    oss << "chunkscribe_average_process_seconds " << snapshot.summary.average_process_seconds << "\n";

    return oss.str();
}

void log_transcription_metric(const std::string& segment, const std::string& model,
                              double audio_minutes, double seconds) {
    std::ostringstream line;
    line << std::fixed << std::setprecision(2)
         << "transcription segment=" << segment << " model=" << model
         << " audio_minutes=" << audio_minutes << " seconds=" << seconds;
    Logger::getInstance().metric(line.str());
}

void log_process_metric(const std::string& group, double total_seconds) {
    std::ostringstream line;
    line << std::fixed << std::setprecision(2) << "process group=" << group << " total_seconds=" << total_seconds;
    Logger::getInstance().metric(line.str());
}

} // namespace chunkscribe
