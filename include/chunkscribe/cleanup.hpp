#pragma once

#include "chunkscribe/config.hpp"
#include "chunkscribe/event_publisher.hpp"
#include "chunkscribe/fragment_store.hpp"
#include "chunkscribe/identity.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chunkscribe {

// An audio segment on disk, located in one of the intake roots.
struct SourceSegment {
    uint32_t sequence;
    std::filesystem::path path;
    std::size_t root_index;
};

struct CleanupReport {
    std::size_t fragments_removed = 0;
    std::size_t segments_removed = 0;
    std::size_t directories_removed = 0;
    std::size_t failures = 0;
};

/**
 * Reclaims storage for a finalized group.
 *
 * Deletions are best effort: each failure is a warning and the remaining
 * files are still processed. After deleting, empty directories are removed
 * bottom-up (module, then course) in every intake root that held one of the
 * group's segments and in the fragments root. The walk stops at the first
 * non-empty directory and never removes a root itself.
 */
class CleanupAgent {
public:
    CleanupAgent(std::vector<IntakeRoot> intake_roots, std::filesystem::path fragments_root,
                 IdentityResolver resolver, std::vector<std::string> audio_extensions,
                 std::shared_ptr<EventPublisher> events);

    // Segment files of key across all intake roots, ascending by sequence.
    std::vector<SourceSegment> find_segments(const GroupKey& key) const;

    bool is_audio_file(const std::filesystem::path& path) const;

    CleanupReport cleanup(const GroupKey& key, const std::vector<Fragment>& fragments,
                          const std::vector<SourceSegment>& segments);

    const std::vector<IntakeRoot>& intake_roots() const { return intake_roots_; }

private:
    struct RemovedLevels {
        bool module = false;
        bool course = false;
        std::size_t count() const { return (module ? 1 : 0) + (course ? 1 : 0); }
    };

    // Removes <root>/<course>/<module> then <root>/<course> while empty.
    RemovedLevels cascade(const std::filesystem::path& root, const GroupKey& key);

    std::vector<IntakeRoot> intake_roots_;
    std::filesystem::path fragments_root_;
    IdentityResolver resolver_;
    std::vector<std::string> audio_extensions_;
    std::shared_ptr<EventPublisher> events_;
};

} // namespace chunkscribe
