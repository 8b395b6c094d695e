#include "chunkscribe/fragment_store.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/fs_util.hpp"
#include "chunkscribe/logging.hpp"

#include <algorithm>

namespace chunkscribe {

std::vector<std::pair<uint32_t, std::string>> FragmentStore::read_all(const GroupKey& key) const {
    auto fragments = list(key);
    std::sort(fragments.begin(), fragments.end(),
              [](const Fragment& a, const Fragment& b) { return a.sequence < b.sequence; });

    std::vector<std::pair<uint32_t, std::string>> contents;
    contents.reserve(fragments.size());
    for (const auto& fragment : fragments) {
        contents.emplace_back(fragment.sequence, read(fragment));
    }
    return contents;
}

FilesystemFragmentStore::FilesystemFragmentStore(std::filesystem::path root, IdentityResolver resolver,
                                                 std::string extension)
    : root_(std::move(root)), resolver_(std::move(resolver)), extension_(std::move(extension)) {}

std::filesystem::path FilesystemFragmentStore::path_for(const GroupKey& key, uint32_t sequence) const {
    return root_ / key.relative_dir() / resolver_.part_filename(key, sequence, extension_);
}

bool FilesystemFragmentStore::exists(const GroupKey& key, uint32_t sequence) const {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path_for(key, sequence), ec)) {
        return true;
    }
    const auto present = list(key);
    return std::any_of(present.begin(), present.end(),
                       [sequence](const Fragment& f) { return f.sequence == sequence; });
}

std::filesystem::path FilesystemFragmentStore::write(const GroupKey& key, uint32_t sequence,
                                                     const std::string& text) {
    const auto path = path_for(key, sequence);
    fs_util::write_file_atomic(path, text);
    LOG_DEBUG("Fragment stored: ", path.string(), " (", text.size(), " bytes)");
    return path;
}

std::vector<Fragment> FilesystemFragmentStore::list(const GroupKey& key) const {
    std::vector<Fragment> fragments;
    const auto dir = root_ / key.relative_dir();

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return fragments;
    }

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        CHUNKSCRIBE_THROW_STORAGE("cannot list fragments: " + ec.message(), dir.string());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        const auto& path = entry.path();
        if (fs_util::is_temp_file(path) || !fs_util::has_extension(path, extension_)) continue;

        // Exact base match: "intro_part1" must not pick up "intro_extra_part1".
        auto name = resolver_.try_resolve(path.filename().string(), key.relative_dir());
        if (name && name->key == key) {
            fragments.push_back(Fragment{name->sequence, path});
        }
    }
    return fragments;
}

std::string FilesystemFragmentStore::read(const Fragment& fragment) const {
    return fs_util::read_file(fragment.path);
}

bool FilesystemFragmentStore::remove(const GroupKey& key, uint32_t sequence) {
    // Zero-padded variants ("_part01") resolve to the same sequence and go too.
    bool removed = false;
    for (const auto& fragment : list(key)) {
        if (fragment.sequence != sequence) continue;
        std::error_code ec;
        removed = std::filesystem::remove(fragment.path, ec) || removed;
        if (ec) {
            CHUNKSCRIBE_THROW_STORAGE("cannot remove fragment: " + ec.message(), fragment.path.string());
        }
    }
    return removed;
}

} // namespace chunkscribe
