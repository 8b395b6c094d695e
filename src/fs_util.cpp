#include "chunkscribe/fs_util.hpp"

#include "chunkscribe/error.hpp"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace chunkscribe::fs_util {

namespace {

constexpr const char* kTempTag = ".tmp.";

std::string temp_name_for(const std::filesystem::path& target) {
    static std::atomic<uint64_t> counter{0};
    std::ostringstream name;
    name << '.' << target.filename().string() << kTempTag
         << ::getpid() << '.' << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.'
         << counter.fetch_add(1, std::memory_order_relaxed);
    return name.str();
}

void sync_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd >= 0) {
        (void)::fsync(fd);
        (void)::close(fd);
    }
}

} // namespace

FileLock::FileLock(FileLock&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

FileLock::~FileLock() {
    release();
}

void FileLock::release() {
    if (fd_ >= 0) {
        (void)::flock(fd_, LOCK_UN);
        (void)::close(fd_);
        fd_ = -1;
    }
}

std::optional<FileLock> FileLock::try_acquire(const std::filesystem::path& path, std::chrono::milliseconds wait) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            CHUNKSCRIBE_THROW_STORAGE("cannot create lock directory: " + ec.message(), path.parent_path().string());
        }
    }

    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        CHUNKSCRIBE_THROW_STORAGE(std::string("cannot open lock file: ") + std::strerror(errno), path.string());
    }
    FileLock lock(fd);

    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return std::optional<FileLock>(std::move(lock));
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            CHUNKSCRIBE_THROW_STORAGE(std::string("cannot lock: ") + std::strerror(errno), path.string());
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
}

void write_file_atomic(const std::filesystem::path& target, std::string_view content) {
    std::error_code ec;
    const auto dir = target.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            CHUNKSCRIBE_THROW_STORAGE("cannot create directory: " + ec.message(), dir.string());
        }
    }

    const auto tmp = dir / temp_name_for(target);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            CHUNKSCRIBE_THROW_STORAGE("cannot open temp file for writing", tmp.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            CHUNKSCRIBE_THROW_STORAGE("short write", tmp.string());
        }
    }
    sync_file(tmp);

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp, cleanup_ec);
        CHUNKSCRIBE_THROW_STORAGE("rename into place failed: " + ec.message(), target.string());
    }
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        CHUNKSCRIBE_THROW_STORAGE("cannot open file", path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        CHUNKSCRIBE_THROW_STORAGE("read failed", path.string());
    }
    return buffer.str();
}

std::string trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

bool is_temp_file(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return !name.empty() && name.front() == '.' && name.find(kTempTag) != std::string::npos;
}

bool has_extension(const std::filesystem::path& path, std::string_view extension) {
    const std::string actual = path.extension().string();
    if (actual.size() != extension.size()) return false;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(actual[i])) !=
            std::tolower(static_cast<unsigned char>(extension[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace chunkscribe::fs_util
