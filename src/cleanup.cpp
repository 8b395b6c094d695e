#include "chunkscribe/cleanup.hpp"

#include "chunkscribe/fs_util.hpp"
#include "chunkscribe/logging.hpp"

#include <algorithm>
#include <set>

namespace chunkscribe {

namespace {

// Removes dir when it exists and is empty. Returns true on removal.
bool remove_if_empty(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return false;
    }
    if (!std::filesystem::is_empty(dir, ec) || ec) {
        return false;
    }
    if (!std::filesystem::remove(dir, ec) || ec) {
        if (ec) {
            LOG_WARNING("Cannot remove empty directory ", dir.string(), ": ", ec.message());
        }
        return false;
    }
    LOG_INFO("Removed empty directory: ", dir.string());
    return true;
}

} // namespace

CleanupAgent::CleanupAgent(std::vector<IntakeRoot> intake_roots, std::filesystem::path fragments_root,
                           IdentityResolver resolver, std::vector<std::string> audio_extensions,
                           std::shared_ptr<EventPublisher> events)
    : intake_roots_(std::move(intake_roots))
    , fragments_root_(std::move(fragments_root))
    , resolver_(std::move(resolver))
    , audio_extensions_(std::move(audio_extensions))
    , events_(std::move(events)) {}

bool CleanupAgent::is_audio_file(const std::filesystem::path& path) const {
    if (fs_util::is_temp_file(path)) return false;
    return std::any_of(audio_extensions_.begin(), audio_extensions_.end(),
                       [&path](const std::string& ext) { return fs_util::has_extension(path, ext); });
}

std::vector<SourceSegment> CleanupAgent::find_segments(const GroupKey& key) const {
    std::vector<SourceSegment> segments;
    for (std::size_t i = 0; i < intake_roots_.size(); ++i) {
        const auto dir = intake_roots_[i].path / key.relative_dir();
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) continue;

        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            LOG_WARNING("Cannot list ", dir.string(), ": ", ec.message());
            continue;
        }
        for (const auto& entry : it) {
            if (!entry.is_regular_file(ec) || !is_audio_file(entry.path())) continue;
            auto name = resolver_.try_resolve(entry.path().filename().string(), key.relative_dir());
            if (name && name->key == key) {
                segments.push_back(SourceSegment{name->sequence, entry.path(), i});
            }
        }
    }
    std::sort(segments.begin(), segments.end(), [](const SourceSegment& a, const SourceSegment& b) {
        return a.sequence != b.sequence ? a.sequence < b.sequence : a.path < b.path;
    });
    return segments;
}

CleanupReport CleanupAgent::cleanup(const GroupKey& key, const std::vector<Fragment>& fragments,
                                    const std::vector<SourceSegment>& segments) {
    CleanupReport report;

    for (const auto& fragment : fragments) {
        std::error_code ec;
        if (std::filesystem::remove(fragment.path, ec)) {
            ++report.fragments_removed;
        } else if (ec) {
            ++report.failures;
            LOG_WARNING("Cannot delete fragment ", fragment.path.string(), ": ", ec.message());
        }
    }

    std::set<std::size_t> touched_roots;
    for (const auto& segment : segments) {
        touched_roots.insert(segment.root_index);
        std::error_code ec;
        if (std::filesystem::remove(segment.path, ec)) {
            ++report.segments_removed;
            LOG_DEBUG("Deleted segment: ", segment.path.string());
        } else if (ec) {
            ++report.failures;
            LOG_WARNING("Cannot delete segment ", segment.path.string(), ": ", ec.message());
        }
    }

    bool module_finished = false;
    bool course_finished = false;
    for (std::size_t index : touched_roots) {
        if (index >= intake_roots_.size()) continue;
        const auto levels = cascade(intake_roots_[index].path, key);
        report.directories_removed += levels.count();
        module_finished = module_finished || levels.module;
        course_finished = course_finished || levels.course;
    }

    if (!fragments.empty()) {
        report.directories_removed += cascade(fragments_root_, key).count();
    }

    if (events_) {
        if (module_finished) {
            events_->publish(EventKind::ModuleFinished, key.course + "/" + key.module,
                             "all recordings of the module are transcribed");
        }
        if (course_finished) {
            events_->publish(EventKind::CourseFinished, key.course,
                             "all recordings of the course are transcribed");
        }
    }

    LOG_INFO("Cleanup of ", key.to_string(), ": ", report.fragments_removed, " fragments, ",
             report.segments_removed, " segments, ", report.directories_removed, " directories removed",
             report.failures ? " (" + std::to_string(report.failures) + " failures)" : std::string());
    return report;
}

CleanupAgent::RemovedLevels CleanupAgent::cascade(const std::filesystem::path& root, const GroupKey& key) {
    RemovedLevels removed;
    if (!key.module.empty()) {
        removed.module = remove_if_empty(root / key.course / key.module);
        if (!removed.module) {
            return removed;
        }
    }
    if (!key.course.empty()) {
        removed.course = remove_if_empty(root / key.course);
    }
    return removed;
}

} // namespace chunkscribe
