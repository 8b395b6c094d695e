#pragma once

#include "chunkscribe/claim_registry.hpp"
#include "chunkscribe/cleanup.hpp"
#include "chunkscribe/completion.hpp"
#include "chunkscribe/compute_slots.hpp"
#include "chunkscribe/event_publisher.hpp"
#include "chunkscribe/fragment_store.hpp"
#include "chunkscribe/fs_util.hpp"
#include "chunkscribe/identity.hpp"
#include "chunkscribe/merge_engine.hpp"
#include "chunkscribe/retry_policy.hpp"
#include "chunkscribe/system_state.hpp"
#include "chunkscribe/transcriber.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace chunkscribe {

enum class Origin {
    Scan,
    Upload
};

// A file some discovery path wants looked at.
struct Candidate {
    std::filesystem::path segment;
    std::size_t root_index = 0;
    Origin origin = Origin::Scan;
};

enum class Outcome {
    Ignored,        // not a segment this pipeline handles
    Finalized,      // artifact already exists
    InFlight,       // another worker is transcribing this segment
    Backoff,        // failed recently, not eligible yet
    DeadLettered,
    Failed,         // transcription or fragment write failed
    Waiting,        // group still has missing parts
    Deferred,       // group claimed elsewhere; holder re-runs the evaluation
    Merged,
    MergeFailed
};

const char* to_string(Outcome outcome);

struct PipelineComponents {
    IdentityResolver resolver;
    std::shared_ptr<FragmentStore> store;
    std::shared_ptr<Transcriber> transcriber;
    std::shared_ptr<CleanupAgent> cleanup;
    std::shared_ptr<MergeEngine> merge;
    std::shared_ptr<ClaimRegistry> group_claims;
    std::shared_ptr<ClaimRegistry> segment_claims;
    std::shared_ptr<RetryTracker> retries;
    std::shared_ptr<ComputeSlots> slots;
    std::shared_ptr<SystemState> state;
    std::shared_ptr<EventPublisher> events;
    double nominal_minutes = 15.0;

    // Lock files serializing group evaluation across processes that share
    // the same directories, e.g. the daemon and a `submit` run. Empty
    // disables them.
    std::filesystem::path lock_root;
    std::chrono::milliseconds lock_wait{2000};
};

/**
 * The one evaluate-and-merge path shared by every discovery worker.
 *
 * For a candidate segment: skip when its group is finalized, transcribe it
 * when no fragment exists (bounded by retries, the segment claim and the
 * compute slots), then evaluate and merge its group under the group claim.
 * The claim is in-process; the group lock file extends it to other processes.
 * Files without a part suffix are whole recordings and go straight to an
 * artifact.
 */
class SegmentPipeline {
public:
    explicit SegmentPipeline(PipelineComponents components);

    Outcome process(const Candidate& candidate, const std::string& worker);

    // Evaluates and, when complete, merges key under its group claim.
    Outcome evaluate_group(const GroupKey& key, const std::string& worker);

    const PipelineComponents& components() const { return c_; }

private:
    Outcome transcribe_segment(const std::filesystem::path& path, const GroupKey& key, uint32_t sequence,
                               const std::string& worker);
    Outcome process_whole(const std::filesystem::path& path, std::size_t root_index, const GroupKey& key,
                          const std::string& worker);
    Outcome process_whole_once(const std::filesystem::path& path, std::size_t root_index, const GroupKey& key,
                               const std::string& worker);
    Outcome evaluate_once(const GroupKey& key, const std::string& worker);

    // Empty when another process holds the group or the lock file is unusable.
    std::optional<fs_util::FileLock> lock_group(const GroupKey& key) const;

    // Shared failure bookkeeping. Returns Failed or DeadLettered.
    Outcome handle_failure(const std::filesystem::path& path, std::filesystem::file_time_type modified,
                           const std::string& reason, const std::string& worker);
    int priority_of(const std::filesystem::path& path) const;
    void record_end_to_end(const GroupKey& key, std::filesystem::file_time_type earliest);

    PipelineComponents c_;
    CompletionDetector detector_;
};

} // namespace chunkscribe
