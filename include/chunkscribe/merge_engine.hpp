#pragma once

#include "chunkscribe/cleanup.hpp"
#include "chunkscribe/event_publisher.hpp"
#include "chunkscribe/fragment_store.hpp"
#include "chunkscribe/identity.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chunkscribe {

struct MergeResult {
    std::filesystem::path artifact;
    std::size_t parts = 0;
    std::size_t bytes = 0;
    CleanupReport cleanup;
};

/**
 * Produces the final artifact of a complete group.
 *
 * Fragments are read in ascending sequence order and joined with a blank
 * line; the joined text is trimmed. Any read or write failure throws
 * MergeIOError before the artifact becomes visible. Once the artifact is in
 * place, cleanup runs synchronously and merge_completed is published.
 *
 * Callers hold the group claim; the engine itself does not lock.
 */
class MergeEngine {
public:
    MergeEngine(std::filesystem::path output_root, std::shared_ptr<FragmentStore> store,
                std::shared_ptr<CleanupAgent> cleanup, std::shared_ptr<EventPublisher> events,
                std::string extension = ".txt");

    // <output_root>/<course>/<module>/<base_name><extension>
    std::filesystem::path artifact_path(const GroupKey& key) const;
    bool artifact_exists(const GroupKey& key) const;

    MergeResult merge(const GroupKey& key, const std::vector<Fragment>& ordered);

    // Whole recordings skip the fragment stage: text goes straight to the
    // artifact and the source is removed.
    MergeResult finalize_single(const GroupKey& key, const std::string& text, const SourceSegment& source);

    static std::string join_fragments(const std::vector<std::string>& parts);

    const std::filesystem::path& output_root() const { return output_root_; }

private:
    std::filesystem::path output_root_;
    std::shared_ptr<FragmentStore> store_;
    std::shared_ptr<CleanupAgent> cleanup_;
    std::shared_ptr<EventPublisher> events_;
    std::string extension_;
};

} // namespace chunkscribe
