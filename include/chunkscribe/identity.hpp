#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>

namespace chunkscribe {

/**
 * Logical recording a segment belongs to.
 *
 * course and module are the first two directory levels below an intake root
 * (empty when the segment sits higher up); base_name is the filename stem with
 * the part suffix removed.
 */
struct GroupKey {
    std::string course;
    std::string module;
    std::string base_name;

    // "course/module" with empty levels omitted; "" for the root.
    std::filesystem::path relative_dir() const;

    // "course/module/base_name" with empty levels omitted.
    std::string to_string() const;

    bool operator==(const GroupKey& other) const {
        return std::tie(course, module, base_name) == std::tie(other.course, other.module, other.base_name);
    }
    bool operator!=(const GroupKey& other) const { return !(*this == other); }
    bool operator<(const GroupKey& other) const {
        return std::tie(course, module, base_name) < std::tie(other.course, other.module, other.base_name);
    }
};

struct SegmentName {
    GroupKey key;
    uint32_t sequence;   // 1-based
};

/**
 * Pure filename grammar for segments:
 *
 *     <base><marker><N>[.<ext>]
 *
 * The last occurrence of the marker splits base from N. N is a run of decimal
 * digits of any width ("7", "07" and "007" are the same part) and must be at
 * least 1. base must be non-empty.
 */
class IdentityResolver {
public:
    static constexpr uint32_t kDefaultMaxPart = 9999;

    explicit IdentityResolver(std::string marker = "_part", uint32_t max_part = kDefaultMaxPart);

    // relative_dir is the segment's directory relative to its intake root.
    // Throws MalformedNameError.
    SegmentName resolve(const std::string& filename, const std::filesystem::path& relative_dir) const;

    std::optional<SegmentName> try_resolve(const std::string& filename,
                                           const std::filesystem::path& relative_dir) const;

    // Key for a file without a part suffix (a whole recording).
    GroupKey whole_key(const std::string& filename, const std::filesystem::path& relative_dir) const;

    // "<base><marker><N><extension>"
    std::string part_filename(const GroupKey& key, uint32_t sequence, const std::string& extension) const;

    const std::string& marker() const { return marker_; }
    uint32_t max_part() const { return max_part_; }

private:
    std::string marker_;
    uint32_t max_part_;
};

// Splits a relative directory into (course, module). Deeper levels are not
// part of the key and are reported through depth.
struct RelativeLocation {
    std::string course;
    std::string module;
    std::size_t depth = 0;
};

RelativeLocation locate(const std::filesystem::path& relative_dir);

} // namespace chunkscribe
