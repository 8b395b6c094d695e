#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chunkscribe::fs_util {

/**
 * Exclusive flock(2) on a lock file, shared by every process that opens the
 * same path. Each acquisition opens its own descriptor, so two holders in one
 * process also exclude each other. Move-only; destruction unlocks.
 *
 * Lock files are never removed: unlinking a path another process is about to
 * lock would let both sides think they hold it.
 */
class FileLock {
public:
    FileLock() = default;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    ~FileLock();

    // Polls until wait has passed; empty when another holder kept the lock.
    // Parent directories are created. Throws StorageError when the lock file
    // cannot be opened.
    static std::optional<FileLock> try_acquire(const std::filesystem::path& path,
                                               std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    bool held() const { return fd_ >= 0; }
    void release();

private:
    explicit FileLock(int fd) : fd_(fd) {}

    int fd_ = -1;
};

// Writes to a hidden sibling temp file, then renames over target, so readers
// either see the previous file or the complete new one. Parent directories
// are created. Throws StorageError; the temp file never survives a failure.
void write_file_atomic(const std::filesystem::path& target, std::string_view content);

// Throws StorageError when the file cannot be opened or read.
std::string read_file(const std::filesystem::path& path);

// Leading and trailing whitespace removed.
std::string trim(std::string_view text);

// True for the temp names produced by write_file_atomic.
bool is_temp_file(const std::filesystem::path& path);

// Case-insensitive extension match, e.g. ".MP3" matches ".mp3".
bool has_extension(const std::filesystem::path& path, std::string_view extension);

} // namespace chunkscribe::fs_util
