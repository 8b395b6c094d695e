#pragma once

#include "chunkscribe/config.hpp"
#include "chunkscribe/discovery.hpp"
#include "chunkscribe/notifier.hpp"
#include "chunkscribe/pipeline.hpp"
#include "chunkscribe/system_state.hpp"
#include "chunkscribe/transcriber.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chunkscribe {

/**
 * Wires the coordinator together from a Config: one scanner and worker per
 * intake root plus the upload worker, all sharing one pipeline.
 *
 * Intake roots are made absolute and, like the fragment and output roots,
 * created when missing. transcriber and notifier default to
 * CommandTranscriber and TelegramNotifier built from the config.
 */
class Service {
public:
    explicit Service(Config config,
                     std::shared_ptr<Transcriber> transcriber = nullptr,
                     std::shared_ptr<Notifier> notifier = nullptr);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    // One scan of every intake root (highest priority first), processed on
    // the calling thread, then the pending uploads. Not for a started service.
    std::size_t run_once();

    // Immediate trigger. Queued on the upload worker; processed by its thread
    // when started, otherwise by the next run_once() or drain_uploads().
    bool submit(const std::filesystem::path& segment);
    std::size_t drain_uploads();

    // Waits until every worker has nothing queued or in hand.
    void wait_idle();

    // Status getters
    StateSnapshot state() const;
    std::string metrics_text() const;
    std::size_t pending_segments(const std::string& root_name) const;
    std::size_t artifact_count() const;
    std::filesystem::path upload_directory() const;

    const Config& config() const { return config_; }
    std::shared_ptr<SegmentPipeline> pipeline() const { return pipeline_; }

private:
    struct RootWorkers {
        std::shared_ptr<DiscoveryWorker> worker;
        std::unique_ptr<DirectoryScanner> scanner;
    };

    Config config_;
    std::shared_ptr<SystemState> state_;
    std::shared_ptr<MergeEngine> merge_;
    std::shared_ptr<SegmentPipeline> pipeline_;
    std::vector<RootWorkers> roots_;
    std::shared_ptr<DiscoveryWorker> upload_worker_;
    std::unique_ptr<UploadTrigger> upload_trigger_;
    bool running_ = false;
};

} // namespace chunkscribe
