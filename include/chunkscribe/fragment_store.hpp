#pragma once

#include "chunkscribe/identity.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace chunkscribe {

struct Fragment {
    uint32_t sequence;
    std::filesystem::path path;
};

/**
 * Key/value surface (group_key, sequence) -> transcribed text.
 *
 * A fragment's existence is the only "already transcribed" marker. write()
 * must be visible to exists() on every thread as soon as it returns.
 * Re-writing a fragment replaces it; callers are expected to check exists()
 * first instead of transcribing again.
 */
class FragmentStore {
public:
    virtual ~FragmentStore() = default;

    virtual bool exists(const GroupKey& key, uint32_t sequence) const = 0;

    // Returns the location of the stored fragment. Throws StorageError.
    virtual std::filesystem::path write(const GroupKey& key, uint32_t sequence, const std::string& text) = 0;

    // All fragments currently present for key, in no particular order.
    virtual std::vector<Fragment> list(const GroupKey& key) const = 0;

    // Throws StorageError when the fragment cannot be read.
    virtual std::string read(const Fragment& fragment) const = 0;

    // Returns false when the fragment was already absent. Throws StorageError.
    virtual bool remove(const GroupKey& key, uint32_t sequence) = 0;

    // Contents ordered by ascending sequence number.
    std::vector<std::pair<uint32_t, std::string>> read_all(const GroupKey& key) const;
};

/**
 * Fragments live at <root>/<course>/<module>/<base><marker><N><ext>, mirroring
 * the intake layout. Directories are created on first write.
 */
class FilesystemFragmentStore : public FragmentStore {
public:
    FilesystemFragmentStore(std::filesystem::path root, IdentityResolver resolver,
                            std::string extension = ".txt");

    bool exists(const GroupKey& key, uint32_t sequence) const override;
    std::filesystem::path write(const GroupKey& key, uint32_t sequence, const std::string& text) override;
    std::vector<Fragment> list(const GroupKey& key) const override;
    std::string read(const Fragment& fragment) const override;
    bool remove(const GroupKey& key, uint32_t sequence) override;

    std::filesystem::path path_for(const GroupKey& key, uint32_t sequence) const;
    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    IdentityResolver resolver_;
    std::string extension_;
};

} // namespace chunkscribe
