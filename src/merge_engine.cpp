#include "chunkscribe/merge_engine.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/fs_util.hpp"
#include "chunkscribe/logging.hpp"

#include <algorithm>
#include <set>

namespace chunkscribe {

MergeEngine::MergeEngine(std::filesystem::path output_root, std::shared_ptr<FragmentStore> store,
                         std::shared_ptr<CleanupAgent> cleanup, std::shared_ptr<EventPublisher> events,
                         std::string extension)
    : output_root_(std::move(output_root))
    , store_(std::move(store))
    , cleanup_(std::move(cleanup))
    , events_(std::move(events))
    , extension_(std::move(extension)) {
    CHUNKSCRIBE_CHECK_ARGUMENT(store_ != nullptr, "merge engine needs a fragment store");
}

std::filesystem::path MergeEngine::artifact_path(const GroupKey& key) const {
    return output_root_ / key.relative_dir() / (key.base_name + extension_);
}

bool MergeEngine::artifact_exists(const GroupKey& key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(artifact_path(key), ec);
}

std::string MergeEngine::join_fragments(const std::vector<std::string>& parts) {
    std::string merged;
    for (const auto& part : parts) {
        merged += part;
        merged += "\n\n";
    }
    return fs_util::trim(merged);
}

MergeResult MergeEngine::merge(const GroupKey& key, const std::vector<Fragment>& ordered) {
    const std::string group = key.to_string();
    if (ordered.empty()) {
        throw MergeIOError("no fragments to merge", group);
    }

    std::vector<Fragment> fragments = ordered;
    std::stable_sort(fragments.begin(), fragments.end(),
                     [](const Fragment& a, const Fragment& b) { return a.sequence < b.sequence; });

    std::vector<std::string> contents;
    contents.reserve(fragments.size());
    for (const auto& fragment : fragments) {
        try {
            contents.push_back(store_->read(fragment));
        } catch (const StorageError& e) {
            throw MergeIOError("cannot read part " + std::to_string(fragment.sequence) + ": " + e.what(), group);
        }
    }

    MergeResult result;
    result.artifact = artifact_path(key);
    result.parts = fragments.size();
    const std::string merged = join_fragments(contents);
    result.bytes = merged.size();

    try {
        fs_util::write_file_atomic(result.artifact, merged);
    } catch (const StorageError& e) {
        throw MergeIOError(std::string("cannot write artifact: ") + e.what(), group);
    }
    LOG_INFO("Merged ", result.parts, " parts of ", group, " into ", result.artifact.string());

    if (cleanup_) {
        // Only the segments whose text went into the artifact are consumed.
        std::set<uint32_t> merged_numbers;
        for (const auto& fragment : fragments) {
            merged_numbers.insert(fragment.sequence);
        }
        std::vector<SourceSegment> consumed;
        for (auto& segment : cleanup_->find_segments(key)) {
            if (merged_numbers.count(segment.sequence)) {
                consumed.push_back(std::move(segment));
            } else {
                LOG_WARNING("Segment ", segment.path.string(), " arrived after ", group, " was merged");
            }
        }
        result.cleanup = cleanup_->cleanup(key, fragments, consumed);
    }

    if (events_) {
        events_->publish(EventKind::MergeCompleted, group,
                         std::to_string(result.parts) + " parts merged into " + result.artifact.string());
    }
    return result;
}

MergeResult MergeEngine::finalize_single(const GroupKey& key, const std::string& text,
                                         const SourceSegment& source) {
    const std::string group = key.to_string();

    MergeResult result;
    result.artifact = artifact_path(key);
    result.parts = 1;
    const std::string trimmed = fs_util::trim(text);
    result.bytes = trimmed.size();

    try {
        fs_util::write_file_atomic(result.artifact, trimmed);
    } catch (const StorageError& e) {
        throw MergeIOError(std::string("cannot write artifact: ") + e.what(), group);
    }
    LOG_INFO("Transcript of ", group, " written to ", result.artifact.string());

    if (cleanup_) {
        result.cleanup = cleanup_->cleanup(key, {}, {source});
    }
    if (events_) {
        events_->publish(EventKind::MergeCompleted, group, "written to " + result.artifact.string());
    }
    return result;
}

} // namespace chunkscribe
