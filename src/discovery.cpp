#include "chunkscribe/discovery.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/logging.hpp"

#include <algorithm>
#include <set>

namespace chunkscribe {

namespace {

bool is_failure(Outcome outcome) {
    return outcome == Outcome::Failed || outcome == Outcome::DeadLettered || outcome == Outcome::MergeFailed;
}

bool contains(const std::filesystem::path& root, const std::filesystem::path& path) {
    const auto relative = path.lexically_relative(root);
    return !relative.empty() && *relative.begin() != "..";
}

} // namespace

// DiscoveryWorker

DiscoveryWorker::DiscoveryWorker(std::string name, std::shared_ptr<SegmentPipeline> pipeline,
                                 std::shared_ptr<SystemState> state)
    : name_(std::move(name)), pipeline_(std::move(pipeline)), state_(std::move(state)) {
    CHUNKSCRIBE_CHECK_ARGUMENT(pipeline_ && state_, "worker needs a pipeline and a state registry");
    state_->register_worker(name_);
}

DiscoveryWorker::~DiscoveryWorker() {
    stop();
}

void DiscoveryWorker::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&DiscoveryWorker::run, this);
    LOG_INFO("Worker ", name_, " started");
}

void DiscoveryWorker::stop() {
    queue_.stop();
    if (thread_.joinable()) {
        thread_.join();
        LOG_INFO("Worker ", name_, " stopped");
    }
    running_ = false;
    state_->update_worker(name_, WorkerStatus::Idle);
}

bool DiscoveryWorker::enqueue(Candidate candidate) {
    const bool queued = queue_.push(std::move(candidate));
    state_->set_queue_size(name_, queue_.size());
    return queued;
}

std::size_t DiscoveryWorker::drain() {
    std::size_t handled = 0;
    Candidate candidate;
    while (queue_.try_pop(candidate)) {
        state_->set_queue_size(name_, queue_.size());
        handle(candidate);
        queue_.done();
        ++handled;
    }
    return handled;
}

void DiscoveryWorker::wait_idle() {
    queue_.wait_idle();
}

void DiscoveryWorker::run() {
    Candidate candidate;
    for (;;) {
        if (state_->worker(name_).status != WorkerStatus::Error) {
            state_->update_worker(name_, WorkerStatus::Waiting);
        }
        if (!queue_.pop(candidate)) {
            break;
        }
        state_->set_queue_size(name_, queue_.size());
        handle(candidate);
        queue_.done();
    }
}

Outcome DiscoveryWorker::handle(const Candidate& candidate) {
    state_->update_worker(name_, WorkerStatus::Processing, candidate.segment.string());
    try {
        const Outcome outcome = pipeline_->process(candidate, name_);
        LOG_DEBUG("Worker ", name_, ": ", candidate.segment.filename().string(), " -> ", to_string(outcome));
        if (is_failure(outcome)) {
            state_->update_worker(name_, WorkerStatus::Error, candidate.segment.string());
        } else {
            state_->update_worker(name_, WorkerStatus::Waiting);
        }
        return outcome;
    } catch (const std::exception& e) {
        LOG_ERROR("Worker ", name_, " failed on ", candidate.segment.string(), ": ", e.what());
        state_->update_worker(name_, WorkerStatus::Error, candidate.segment.string());
        return Outcome::Failed;
    }
}

// DirectoryScanner

DirectoryScanner::DirectoryScanner(std::size_t root_index, IntakeRoot root, IdentityResolver resolver,
                                   std::shared_ptr<CleanupAgent> cleanup, std::shared_ptr<FragmentStore> store,
                                   std::shared_ptr<MergeEngine> merge, std::shared_ptr<DiscoveryWorker> worker,
                                   std::chrono::seconds interval)
    : root_index_(root_index)
    , root_(std::move(root))
    , resolver_(std::move(resolver))
    , cleanup_(std::move(cleanup))
    , store_(std::move(store))
    , merge_(std::move(merge))
    , worker_(std::move(worker))
    , interval_(interval) {
    CHUNKSCRIBE_CHECK_ARGUMENT(cleanup_ && store_ && merge_ && worker_, "scanner components missing");
}

DirectoryScanner::~DirectoryScanner() {
    stop();
}

std::vector<DirectoryScanner::Found> DirectoryScanner::list_audio_files() const {
    std::vector<Found> found;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_.path, ec)) {
        LOG_WARNING("Intake root ", root_.name, " (", root_.path.string(), ") is not a directory");
        return found;
    }

    std::filesystem::recursive_directory_iterator it(
        root_.path, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_ERROR("Cannot scan ", root_.path.string(), ": ", ec.message());
        return found;
    }

    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARNING("Scan of ", root_.path.string(), " interrupted: ", ec.message());
            break;
        }
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            // course (depth 0) and module (depth 1) directories are walked, nothing below.
            if (it.depth() >= 2) {
                it.disable_recursion_pending();
                LOG_WARNING("Ignoring ", entry.path().string(), ": deeper than course/module");
            }
            continue;
        }
        if (!entry.is_regular_file(entry_ec) || !cleanup_->is_audio_file(entry.path())) {
            continue;
        }
        found.push_back(Found{entry.path(), entry.path().parent_path().lexically_relative(root_.path)});
    }

    std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) { return a.path < b.path; });
    return found;
}

std::size_t DirectoryScanner::scan_once() {
    const auto files = list_audio_files();
    std::size_t queued = 0;
    std::set<GroupKey> revisit;

    for (const auto& file : files) {
        const std::string filename = file.path.filename().string();
        const auto name = resolver_.try_resolve(filename, file.relative_dir);
        const GroupKey key = name ? name->key : resolver_.whole_key(filename, file.relative_dir);

        if (merge_->artifact_exists(key)) {
            continue;
        }
        if (name && store_->exists(name->key, name->sequence)) {
            // Already transcribed: one candidate per group re-runs the evaluation.
            if (!revisit.insert(key).second) {
                continue;
            }
        }
        if (worker_->enqueue(Candidate{file.path, root_index_, Origin::Scan})) {
            ++queued;
        }
    }

    LOG_DEBUG("Scan of ", root_.name, ": ", files.size(), " audio files, ", queued, " candidates queued");
    return queued;
}

std::size_t DirectoryScanner::pending_segments() const {
    std::size_t pending = 0;
    for (const auto& file : list_audio_files()) {
        const auto name = resolver_.try_resolve(file.path.filename().string(), file.relative_dir);
        if (name) {
            if (!store_->exists(name->key, name->sequence)) ++pending;
        } else if (!merge_->artifact_exists(resolver_.whole_key(file.path.filename().string(), file.relative_dir))) {
            ++pending;
        }
    }
    return pending;
}

void DirectoryScanner::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable()) {
            return;
        }
        stop_requested_ = false;
    }
    thread_ = std::thread(&DirectoryScanner::loop, this);
    LOG_INFO("Scanner for ", root_.name, " started (every ", interval_.count(), "s)");
}

void DirectoryScanner::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DirectoryScanner::loop() {
    for (;;) {
        try {
            scan_once();
        } catch (const std::exception& e) {
            LOG_ERROR("Scan of ", root_.name, " failed: ", e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
    }
}

// UploadTrigger

UploadTrigger::UploadTrigger(std::vector<IntakeRoot> roots, std::shared_ptr<DiscoveryWorker> worker)
    : roots_(std::move(roots)), worker_(std::move(worker)) {
    CHUNKSCRIBE_CHECK_ARGUMENT(worker_ != nullptr, "upload trigger needs a worker");
}

bool UploadTrigger::submit(const std::filesystem::path& segment) {
    const auto path = std::filesystem::absolute(segment).lexically_normal();
    for (std::size_t i = 0; i < roots_.size(); ++i) {
        if (contains(roots_[i].path, path)) {
            LOG_INFO("Upload accepted: ", path.string());
            return worker_->enqueue(Candidate{path, i, Origin::Upload});
        }
    }
    throw InvalidArgumentError("upload is outside every intake root", path.string());
}

} // namespace chunkscribe
