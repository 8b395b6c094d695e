#include "chunkscribe/service.hpp"

#include "chunkscribe/claim_registry.hpp"
#include "chunkscribe/error.hpp"
#include "chunkscribe/fs_util.hpp"
#include "chunkscribe/logging.hpp"
#include "chunkscribe/metrics.hpp"
#include "chunkscribe/telegram_notifier.hpp"

#include <algorithm>
#include <numeric>

namespace chunkscribe {

namespace {

void ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        CHUNKSCRIBE_THROW_STORAGE("cannot create directory: " + ec.message(), dir.string());
    }
}

} // namespace

Service::Service(Config config, std::shared_ptr<Transcriber> transcriber, std::shared_ptr<Notifier> notifier)
    : config_(std::move(config)) {
    validate_config(config_);

    for (auto& root : config_.paths.intake_roots) {
        root.path = std::filesystem::absolute(root.path).lexically_normal();
        ensure_directory(root.path);
    }
    config_.paths.fragments_root = std::filesystem::absolute(config_.paths.fragments_root).lexically_normal();
    config_.paths.output_root = std::filesystem::absolute(config_.paths.output_root).lexically_normal();
    ensure_directory(config_.paths.fragments_root);
    ensure_directory(config_.paths.output_root);

    if (!transcriber) {
        transcriber = std::make_shared<CommandTranscriber>(config_.transcription.command, config_.transcription.model);
    }
    if (!notifier) {
        notifier = std::make_shared<TelegramNotifier>(config_.telegram);
    }

    state_ = std::make_shared<SystemState>(config_.metrics.sample_capacity, config_.metrics.event_capacity);
    auto events = std::make_shared<EventPublisher>(state_, notifier);

    const IdentityResolver resolver(config_.segments.marker, config_.segments.max_part);
    auto store = std::make_shared<FilesystemFragmentStore>(config_.paths.fragments_root, resolver,
                                                           config_.segments.fragment_extension);
    auto cleanup = std::make_shared<CleanupAgent>(config_.paths.intake_roots, config_.paths.fragments_root, resolver,
                                                  config_.segments.audio_extensions, events);
    merge_ = std::make_shared<MergeEngine>(config_.paths.output_root, store, cleanup, events,
                                           config_.segments.fragment_extension);

    PipelineComponents components{
        resolver,
        store,
        transcriber,
        cleanup,
        merge_,
        std::make_shared<ClaimRegistry>(),
        std::make_shared<ClaimRegistry>(),
        std::make_shared<RetryTracker>(config_.retry),
        std::make_shared<ComputeSlots>(config_.transcription.max_concurrent),
        state_,
        events,
        config_.segments.nominal_minutes,
        config_.paths.output_root / ".locks",
    };
    pipeline_ = std::make_shared<SegmentPipeline>(std::move(components));

    const std::chrono::seconds interval(config_.scan.interval_seconds);
    for (std::size_t i = 0; i < config_.paths.intake_roots.size(); ++i) {
        const auto& root = config_.paths.intake_roots[i];
        RootWorkers workers;
        workers.worker = std::make_shared<DiscoveryWorker>("scanner:" + root.name, pipeline_, state_);
        workers.scanner = std::make_unique<DirectoryScanner>(i, root, resolver, cleanup, store, merge_,
                                                             workers.worker, interval);
        roots_.push_back(std::move(workers));
    }

    upload_worker_ = std::make_shared<DiscoveryWorker>("upload", pipeline_, state_);
    upload_trigger_ = std::make_unique<UploadTrigger>(config_.paths.intake_roots, upload_worker_);

    LOG_INFO("Service configured: ", roots_.size(), " intake roots, fragments in ",
             config_.paths.fragments_root.string(), ", transcripts in ", config_.paths.output_root.string());
}

Service::~Service() {
    stop();
}

void Service::start() {
    if (running_) {
        return;
    }
    upload_worker_->start();
    for (auto& root : roots_) {
        root.worker->start();
        root.scanner->start();
    }
    running_ = true;
    LOG_INFO("Service started");
}

void Service::stop() {
    if (!running_) {
        return;
    }
    for (auto& root : roots_) {
        root.scanner->stop();
    }
    for (auto& root : roots_) {
        root.worker->stop();
    }
    upload_worker_->stop();
    running_ = false;
    LOG_INFO("Service stopped");
}

std::size_t Service::run_once() {
    CHUNKSCRIBE_CHECK_ARGUMENT(!running_, "run_once on a started service");

    std::vector<std::size_t> order(roots_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return config_.paths.intake_roots[a].priority > config_.paths.intake_roots[b].priority;
    });

    std::size_t handled = 0;
    for (std::size_t index : order) {
        roots_[index].scanner->scan_once();
        handled += roots_[index].worker->drain();
    }
    handled += drain_uploads();
    LOG_INFO("Single pass finished: ", handled, " candidates handled");
    return handled;
}

bool Service::submit(const std::filesystem::path& segment) {
    return upload_trigger_->submit(segment);
}

std::size_t Service::drain_uploads() {
    return upload_worker_->drain();
}

void Service::wait_idle() {
    for (auto& root : roots_) {
        root.worker->wait_idle();
    }
    upload_worker_->wait_idle();
}

StateSnapshot Service::state() const {
    return state_->snapshot();
}

std::string Service::metrics_text() const {
    return export_prometheus(state_->snapshot());
}

std::size_t Service::pending_segments(const std::string& root_name) const {
    for (const auto& root : roots_) {
        if (root.scanner->root().name == root_name) {
            return root.scanner->pending_segments();
        }
    }
    throw InvalidArgumentError("unknown intake root '" + root_name + "'", "pending_segments");
}

std::size_t Service::artifact_count() const {
    std::size_t count = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        config_.paths.output_root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARNING("Cannot list ", config_.paths.output_root.string(), ": ", ec.message());
        return count;
    }
    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code entry_ec;
        const auto& path = it->path();
        if (it->is_regular_file(entry_ec) && !fs_util::is_temp_file(path)
            && fs_util::has_extension(path, config_.segments.fragment_extension)) {
            ++count;
        }
    }
    return count;
}

std::filesystem::path Service::upload_directory() const {
    const IntakeRoot* root = find_intake_root(config_, config_.paths.upload_root);
    const auto base = root ? root->path : config_.paths.intake_roots.front().path;
    return base / config_.paths.upload_subdir;
}

} // namespace chunkscribe
