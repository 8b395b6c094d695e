#pragma once

#include <stdexcept>
#include <string>

namespace chunkscribe {

/**
 * Error taxonomy for the segment coordinator.
 *
 * Only conditions that abort an operation are thrown. Cleanup failures are
 * logged warnings and claim contention is an empty optional, so neither has
 * an exception type.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    INTERNAL_ERROR = 2,

    // Naming
    MALFORMED_NAME = 100,

    // Transcription
    TRANSCRIPTION_FAILED = 200,

    // Storage
    FILE_NOT_FOUND = 300,
    STORAGE_FAILED = 301,
    MERGE_IO_FAILED = 302,

    // Configuration
    CONFIG_INVALID = 400,

    // Network
    NETWORK_FAILED = 500
};

const char* error_code_name(ErrorCode code) noexcept;

class ChunkscribeException : public std::runtime_error {
public:
    explicit ChunkscribeException(ErrorCode code, const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        if (!suggestion.empty()) {
            result += " (" + suggestion + ")";
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public ChunkscribeException {
public:
    explicit InvalidArgumentError(const std::string& message, const std::string& context = "")
        : ChunkscribeException(ErrorCode::INVALID_ARGUMENT, message, context) {}
};

// Segment filename does not follow <base><marker><N>.<ext>. Callers treat the
// file as a whole recording rather than as an error.
class MalformedNameError : public ChunkscribeException {
public:
    explicit MalformedNameError(const std::string& filename, const std::string& reason)
        : ChunkscribeException(ErrorCode::MALFORMED_NAME, reason, filename)
        , filename_(filename) {}

    const std::string& filename() const noexcept { return filename_; }

private:
    std::string filename_;
};

class TranscriptionError : public ChunkscribeException {
public:
    explicit TranscriptionError(const std::string& message, const std::string& segment = "")
        : ChunkscribeException(ErrorCode::TRANSCRIPTION_FAILED, message, segment) {}
};

class StorageError : public ChunkscribeException {
public:
    explicit StorageError(const std::string& message, const std::string& path = "")
        : ChunkscribeException(ErrorCode::STORAGE_FAILED, message, path) {}
};

// A merge attempt was abandoned before its artifact became visible.
class MergeIOError : public ChunkscribeException {
public:
    explicit MergeIOError(const std::string& message, const std::string& group = "")
        : ChunkscribeException(ErrorCode::MERGE_IO_FAILED, message, group,
                               "group stays evaluable and is retried on the next pass") {}
};

class ConfigError : public ChunkscribeException {
public:
    explicit ConfigError(const std::string& message, const std::string& key = "")
        : ChunkscribeException(ErrorCode::CONFIG_INVALID, message, key) {}
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::INTERNAL_ERROR: return "internal error";
        case ErrorCode::MALFORMED_NAME: return "malformed segment name";
        case ErrorCode::TRANSCRIPTION_FAILED: return "transcription failed";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::STORAGE_FAILED: return "storage failure";
        case ErrorCode::MERGE_IO_FAILED: return "merge I/O failure";
        case ErrorCode::CONFIG_INVALID: return "invalid configuration";
        case ErrorCode::NETWORK_FAILED: return "network failure";
    }
    return "unknown error";
}

#define CHUNKSCRIBE_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw ::chunkscribe::InvalidArgumentError(message, __func__); } while (0)

#define CHUNKSCRIBE_THROW_STORAGE(message, path) \
    throw ::chunkscribe::StorageError(message, path)

} // namespace chunkscribe
