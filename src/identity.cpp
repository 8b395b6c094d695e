#include "chunkscribe/identity.hpp"

#include "chunkscribe/error.hpp"

#include <cctype>
#include <string>

namespace chunkscribe {

std::filesystem::path GroupKey::relative_dir() const {
    std::filesystem::path dir;
    if (!course.empty()) dir /= course;
    if (!module.empty()) dir /= module;
    return dir;
}

std::string GroupKey::to_string() const {
    std::string result;
    for (const std::string* part : {&course, &module}) {
        if (!part->empty()) {
            result += *part;
            result += '/';
        }
    }
    return result + base_name;
}

RelativeLocation locate(const std::filesystem::path& relative_dir) {
    RelativeLocation location;
    for (const auto& component : relative_dir) {
        const std::string name = component.string();
        if (name.empty() || name == ".") continue;
        if (location.depth == 0) {
            location.course = name;
        } else if (location.depth == 1) {
            location.module = name;
        }
        ++location.depth;
    }
    return location;
}

IdentityResolver::IdentityResolver(std::string marker, uint32_t max_part)
    : marker_(std::move(marker)), max_part_(max_part) {
    CHUNKSCRIBE_CHECK_ARGUMENT(!marker_.empty(), "segment marker must not be empty");
    CHUNKSCRIBE_CHECK_ARGUMENT(max_part_ >= 1, "max part number must be at least 1");
}

SegmentName IdentityResolver::resolve(const std::string& filename,
                                      const std::filesystem::path& relative_dir) const {
    const std::string stem = std::filesystem::path(filename).stem().string();

    const auto pos = stem.rfind(marker_);
    if (pos == std::string::npos) {
        throw MalformedNameError(filename, "no '" + marker_ + "' marker");
    }
    if (pos == 0) {
        throw MalformedNameError(filename, "empty base name");
    }

    const std::string digits = stem.substr(pos + marker_.size());
    if (digits.empty()) {
        throw MalformedNameError(filename, "missing part number");
    }

    uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw MalformedNameError(filename, "part number is not numeric");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > max_part_) {
            throw MalformedNameError(filename, "part number above " + std::to_string(max_part_));
        }
    }
    if (value == 0) {
        throw MalformedNameError(filename, "part numbers start at 1");
    }

    const RelativeLocation location = locate(relative_dir);
    return SegmentName{GroupKey{location.course, location.module, stem.substr(0, pos)},
                       static_cast<uint32_t>(value)};
}

std::optional<SegmentName> IdentityResolver::try_resolve(const std::string& filename,
                                                         const std::filesystem::path& relative_dir) const {
    try {
        return resolve(filename, relative_dir);
    } catch (const MalformedNameError&) {
        return std::nullopt;
    }
}

GroupKey IdentityResolver::whole_key(const std::string& filename,
                                     const std::filesystem::path& relative_dir) const {
    const RelativeLocation location = locate(relative_dir);
    return GroupKey{location.course, location.module, std::filesystem::path(filename).stem().string()};
}

std::string IdentityResolver::part_filename(const GroupKey& key, uint32_t sequence,
                                            const std::string& extension) const {
    return key.base_name + marker_ + std::to_string(sequence) + extension;
}

} // namespace chunkscribe
