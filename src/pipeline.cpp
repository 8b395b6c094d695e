#include "chunkscribe/pipeline.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/logging.hpp"
#include "chunkscribe/metrics.hpp"

#include <algorithm>
#include <set>

namespace chunkscribe {

namespace {

const FragmentStore& require_store(const std::shared_ptr<FragmentStore>& store) {
    if (!store) {
        throw InvalidArgumentError("pipeline needs a fragment store", "SegmentPipeline");
    }
    return *store;
}

} // namespace

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Ignored: return "ignored";
        case Outcome::Finalized: return "finalized";
        case Outcome::InFlight: return "in-flight";
        case Outcome::Backoff: return "backoff";
        case Outcome::DeadLettered: return "dead-lettered";
        case Outcome::Failed: return "failed";
        case Outcome::Waiting: return "waiting";
        case Outcome::Deferred: return "deferred";
        case Outcome::Merged: return "merged";
        case Outcome::MergeFailed: return "merge-failed";
    }
    return "unknown";
}

SegmentPipeline::SegmentPipeline(PipelineComponents components)
    : c_(std::move(components)), detector_(require_store(c_.store)) {
    CHUNKSCRIBE_CHECK_ARGUMENT(c_.transcriber && c_.cleanup && c_.merge, "pipeline components missing");
    CHUNKSCRIBE_CHECK_ARGUMENT(c_.group_claims && c_.segment_claims && c_.retries && c_.slots,
                               "pipeline coordination components missing");
    CHUNKSCRIBE_CHECK_ARGUMENT(c_.state && c_.events, "pipeline state components missing");
}

Outcome SegmentPipeline::process(const Candidate& candidate, const std::string& worker) {
    const auto& roots = c_.cleanup->intake_roots();
    if (candidate.root_index >= roots.size()) {
        LOG_WARNING("Candidate ", candidate.segment.string(), " names an unknown intake root");
        return Outcome::Ignored;
    }
    const auto& root = roots[candidate.root_index];
    const auto& path = candidate.segment;

    const auto relative = path.parent_path().lexically_relative(root.path);
    if (relative.empty() || *relative.begin() == "..") {
        LOG_WARNING("Candidate ", path.string(), " is outside intake root ", root.path.string());
        return Outcome::Ignored;
    }
    const RelativeLocation location = locate(relative);
    if (location.depth > 2) {
        LOG_WARNING("Ignoring ", path.string(), ": deeper than course/module");
        return Outcome::Ignored;
    }

    const std::string filename = path.filename().string();
    const auto name = c_.resolver.try_resolve(filename, relative);
    if (!name) {
        return process_whole(path, candidate.root_index, c_.resolver.whole_key(filename, relative), worker);
    }

    if (c_.merge->artifact_exists(name->key)) {
        LOG_DEBUG("Group ", name->key.to_string(), " already finalized; skipping ", filename);
        return Outcome::Finalized;
    }

    if (!c_.store->exists(name->key, name->sequence)) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            LOG_DEBUG("Segment ", path.string(), " disappeared before transcription");
            return Outcome::Ignored;
        }
        const Outcome transcribed = transcribe_segment(path, name->key, name->sequence, worker);
        if (transcribed != Outcome::Waiting) {
            return transcribed;
        }
    } else {
        LOG_DEBUG("Fragment for ", filename, " already exists; skipping transcription");
    }

    return evaluate_group(name->key, worker);
}

Outcome SegmentPipeline::transcribe_segment(const std::filesystem::path& path, const GroupKey& key,
                                            uint32_t sequence, const std::string& worker) {
    std::error_code ec;
    const auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        LOG_WARNING("Cannot stat ", path.string(), ": ", ec.message());
        return Outcome::Ignored;
    }

    const RetryDecision decision = c_.retries->check(path.string(), modified);
    if (decision == RetryDecision::Backoff) {
        LOG_DEBUG("Segment ", path.string(), " is backing off");
        return Outcome::Backoff;
    }
    if (decision == RetryDecision::DeadLettered) {
        return Outcome::DeadLettered;
    }

    auto claim = c_.segment_claims->try_claim(path.string());
    if (!claim) {
        LOG_DEBUG("Segment ", path.string(), " is being transcribed by another worker");
        return Outcome::InFlight;
    }
    // Another worker may have finished it between the first check and the claim.
    if (c_.store->exists(key, sequence)) {
        return Outcome::Waiting;
    }

    LOG_INFO("Transcribing ", path.string());
    c_.state->update_worker(worker, WorkerStatus::Processing, path.string());

    std::string text;
    double seconds = 0.0;
    {
        ComputeSlots::Lease lease(*c_.slots, priority_of(path));
        ScopedTimer timer;
        try {
            text = c_.transcriber->transcribe(path);
        } catch (const TranscriptionError& e) {
            return handle_failure(path, modified, e.what(), worker);
        }
        seconds = timer.elapsed_seconds();
    }

    try {
        c_.store->write(key, sequence, text);
    } catch (const StorageError& e) {
        return handle_failure(path, modified, e.what(), worker);
    }

    c_.retries->record_success(path.string());
    c_.state->increment_files_processed();
    c_.state->record_transcription(c_.transcriber->model_name(), c_.nominal_minutes, seconds);
    log_transcription_metric(path.filename().string(), c_.transcriber->model_name(), c_.nominal_minutes, seconds);
    LOG_INFO("Transcribed ", path.filename().string(), " in ", seconds, "s");
    return Outcome::Waiting;
}

Outcome SegmentPipeline::handle_failure(const std::filesystem::path& path, std::filesystem::file_time_type modified,
                                        const std::string& reason, const std::string& worker) {
    LOG_ERROR("Transcription of ", path.string(), " failed: ", reason);
    c_.state->increment_transcription_failures();
    c_.state->update_worker(worker, WorkerStatus::Error, path.string());

    if (c_.retries->record_failure(path.string(), modified)) {
        c_.state->increment_dead_lettered();
        c_.events->publish(EventKind::Error, path.string(), "gave up after repeated failures: " + reason);
        return Outcome::DeadLettered;
    }
    return Outcome::Failed;
}

std::optional<fs_util::FileLock> SegmentPipeline::lock_group(const GroupKey& key) const {
    if (c_.lock_root.empty()) {
        return fs_util::FileLock();
    }
    const auto path = c_.lock_root / (key.to_string() + ".lock");
    try {
        auto lock = fs_util::FileLock::try_acquire(path, c_.lock_wait);
        if (!lock) {
            LOG_DEBUG("Group ", key.to_string(), " is locked by another process");
        }
        return lock;
    } catch (const StorageError& e) {
        LOG_ERROR("Cannot lock group ", key.to_string(), ": ", e.what());
        return std::nullopt;
    }
}

Outcome SegmentPipeline::evaluate_group(const GroupKey& key, const std::string& worker) {
    auto claim = c_.group_claims->try_claim(key.to_string());
    if (!claim) {
        LOG_DEBUG("Group ", key.to_string(), " is being evaluated elsewhere");
        return Outcome::Deferred;
    }
    auto lock = lock_group(key);
    if (!lock) {
        return Outcome::Deferred;
    }

    Outcome outcome = Outcome::Waiting;
    do {
        outcome = evaluate_once(key, worker);
    } while (claim->finish_or_rerun());
    return outcome;
}

Outcome SegmentPipeline::evaluate_once(const GroupKey& key, const std::string& worker) {
    if (c_.merge->artifact_exists(key)) {
        return Outcome::Finalized;
    }

    const auto segments = c_.cleanup->find_segments(key);
    std::set<uint32_t> pending;
    for (const auto& segment : segments) {
        if (!c_.store->exists(key, segment.sequence)) {
            pending.insert(segment.sequence);
        }
    }

    const Evaluation evaluation = detector_.evaluate(key, pending);
    if (evaluation.state == GroupState::Empty) {
        return Outcome::Waiting;
    }
    if (evaluation.state == GroupState::Incomplete) {
        LOG_INFO("Waiting for parts of ", key.to_string(), ". Missing ", evaluation.missing_count, ": ",
                 format_sequence_set(evaluation.missing));
        return Outcome::Waiting;
    }

    std::filesystem::file_time_type earliest = std::filesystem::file_time_type::max();
    for (const auto& segment : segments) {
        std::error_code ec;
        const auto modified = std::filesystem::last_write_time(segment.path, ec);
        if (!ec) earliest = std::min(earliest, modified);
    }

    c_.state->update_worker(worker, WorkerStatus::Processing, "merging " + key.to_string());
    try {
        c_.merge->merge(key, evaluation.fragments);
    } catch (const MergeIOError& e) {
        if (c_.merge->artifact_exists(key)) {
            LOG_INFO("Group ", key.to_string(), " was merged by another process");
            return Outcome::Finalized;
        }
        LOG_ERROR("Merge of ", key.to_string(), " aborted: ", e.what());
        c_.state->update_worker(worker, WorkerStatus::Error, key.to_string());
        c_.events->publish(EventKind::Error, key.to_string(), e.what());
        return Outcome::MergeFailed;
    }

    c_.state->increment_groups_merged();
    record_end_to_end(key, earliest);
    return Outcome::Merged;
}

Outcome SegmentPipeline::process_whole(const std::filesystem::path& path, std::size_t root_index,
                                       const GroupKey& key, const std::string& worker) {
    auto claim = c_.group_claims->try_claim(key.to_string());
    if (!claim) {
        return Outcome::Deferred;
    }
    auto lock = lock_group(key);
    if (!lock) {
        return Outcome::Deferred;
    }

    Outcome outcome = Outcome::Waiting;
    do {
        outcome = process_whole_once(path, root_index, key, worker);
    } while (claim->finish_or_rerun());
    return outcome;
}

Outcome SegmentPipeline::process_whole_once(const std::filesystem::path& path, std::size_t root_index,
                                            const GroupKey& key, const std::string& worker) {
    if (c_.merge->artifact_exists(key)) {
        LOG_DEBUG("Transcript of ", key.to_string(), " already exists; skipping ", path.string());
        return Outcome::Finalized;
    }

    std::error_code ec;
    const auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return Outcome::Ignored;
    }

    const RetryDecision decision = c_.retries->check(path.string(), modified);
    if (decision == RetryDecision::Backoff) return Outcome::Backoff;
    if (decision == RetryDecision::DeadLettered) return Outcome::DeadLettered;

    LOG_INFO("Transcribing whole recording ", path.string());
    c_.state->update_worker(worker, WorkerStatus::Processing, path.string());

    std::string text;
    double seconds = 0.0;
    {
        ComputeSlots::Lease lease(*c_.slots, priority_of(path));
        ScopedTimer timer;
        try {
            text = c_.transcriber->transcribe(path);
        } catch (const TranscriptionError& e) {
            return handle_failure(path, modified, e.what(), worker);
        }
        seconds = timer.elapsed_seconds();
    }

    c_.retries->record_success(path.string());
    c_.state->increment_files_processed();
    c_.state->record_transcription(c_.transcriber->model_name(), c_.nominal_minutes, seconds);
    log_transcription_metric(path.filename().string(), c_.transcriber->model_name(), c_.nominal_minutes, seconds);

    try {
        c_.merge->finalize_single(key, text, SourceSegment{1, path, root_index});
    } catch (const MergeIOError& e) {
        if (c_.merge->artifact_exists(key)) {
            LOG_INFO("Transcript of ", key.to_string(), " was written by another process");
            return Outcome::Finalized;
        }
        LOG_ERROR("Writing transcript of ", key.to_string(), " failed: ", e.what());
        c_.state->update_worker(worker, WorkerStatus::Error, key.to_string());
        c_.events->publish(EventKind::Error, key.to_string(), e.what());
        return Outcome::MergeFailed;
    }

    record_end_to_end(key, modified);
    return Outcome::Merged;
}

int SegmentPipeline::priority_of(const std::filesystem::path& path) const {
    for (const auto& root : c_.cleanup->intake_roots()) {
        const auto relative = path.lexically_relative(root.path);
        if (!relative.empty() && *relative.begin() != "..") {
            return root.priority;
        }
    }
    return 0;
}

void SegmentPipeline::record_end_to_end(const GroupKey& key, std::filesystem::file_time_type earliest) {
    if (earliest == std::filesystem::file_time_type::max()) {
        return;
    }
    const auto elapsed = std::filesystem::file_time_type::clock::now() - earliest;
    const double seconds = std::max(0.0, std::chrono::duration<double>(elapsed).count());
    c_.state->record_process(key.to_string(), seconds);
    log_process_metric(key.to_string(), seconds);
}

} // namespace chunkscribe
