#pragma once

#include "chunkscribe/config.hpp"
#include "chunkscribe/pipeline.hpp"
#include "chunkscribe/work_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkscribe {

/**
 * One named consumer of candidates. Each candidate runs through the shared
 * pipeline; exceptions are logged and put the worker in the error state
 * until the next candidate.
 */
class DiscoveryWorker {
public:
    DiscoveryWorker(std::string name, std::shared_ptr<SegmentPipeline> pipeline,
                    std::shared_ptr<SystemState> state);
    ~DiscoveryWorker();

    DiscoveryWorker(const DiscoveryWorker&) = delete;
    DiscoveryWorker& operator=(const DiscoveryWorker&) = delete;

    void start();
    // Finishes the candidate in hand, drops the rest and joins the thread.
    void stop();

    bool enqueue(Candidate candidate);

    // Processes everything queued on the calling thread. Only for workers
    // that were not started.
    std::size_t drain();

    // Blocks until a started worker has nothing queued or in hand.
    void wait_idle();

    const std::string& name() const { return name_; }
    std::size_t queued() const { return queue_.size(); }
    bool running() const { return running_.load(); }

private:
    void run();
    Outcome handle(const Candidate& candidate);

    std::string name_;
    std::shared_ptr<SegmentPipeline> pipeline_;
    std::shared_ptr<SystemState> state_;
    CandidateQueue queue_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

/**
 * Periodic walk of one intake root.
 *
 * Every pass queues each segment that has no fragment yet, each whole
 * recording without an artifact, and one segment per already transcribed
 * group so the group is evaluated again. Files deeper than course/module are
 * not looked at.
 */
class DirectoryScanner {
public:
    DirectoryScanner(std::size_t root_index, IntakeRoot root, IdentityResolver resolver,
                     std::shared_ptr<CleanupAgent> cleanup, std::shared_ptr<FragmentStore> store,
                     std::shared_ptr<MergeEngine> merge, std::shared_ptr<DiscoveryWorker> worker,
                     std::chrono::seconds interval);
    ~DirectoryScanner();

    DirectoryScanner(const DirectoryScanner&) = delete;
    DirectoryScanner& operator=(const DirectoryScanner&) = delete;

    // One pass; returns the number of candidates queued.
    std::size_t scan_once();

    void start();
    void stop();

    // Segment files in this root still waiting for transcription.
    std::size_t pending_segments() const;

    const IntakeRoot& root() const { return root_; }

private:
    struct Found {
        std::filesystem::path path;
        std::filesystem::path relative_dir;
    };

    std::vector<Found> list_audio_files() const;
    void loop();

    std::size_t root_index_;
    IntakeRoot root_;
    IdentityResolver resolver_;
    std::shared_ptr<CleanupAgent> cleanup_;
    std::shared_ptr<FragmentStore> store_;
    std::shared_ptr<MergeEngine> merge_;
    std::shared_ptr<DiscoveryWorker> worker_;
    std::chrono::seconds interval_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
};

// Immediate entry point for freshly accepted uploads.
class UploadTrigger {
public:
    UploadTrigger(std::vector<IntakeRoot> roots, std::shared_ptr<DiscoveryWorker> worker);

    // Queues path on the upload worker. Throws InvalidArgumentError when the
    // path lies outside every intake root.
    bool submit(const std::filesystem::path& segment);

private:
    std::vector<IntakeRoot> roots_;
    std::shared_ptr<DiscoveryWorker> worker_;
};

} // namespace chunkscribe
