#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace chunkscribe {

// Maps one audio file to its text. Implementations may take minutes.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Throws TranscriptionError.
    virtual std::string transcribe(const std::filesystem::path& audio) = 0;

    virtual std::string model_name() const = 0;
};

/**
 * Runs an external speech-to-text command and returns its standard output.
 *
 * command is an argv template; "{input}" expands to the audio path and
 * "{model}" to the model name in every argument. A bare program name is
 * looked up on PATH. Launch failure or a non-zero exit status is a
 * TranscriptionError. No timeout is applied.
 */
class CommandTranscriber : public Transcriber {
public:
    CommandTranscriber(std::vector<std::string> command, std::string model);

    std::string transcribe(const std::filesystem::path& audio) override;
    std::string model_name() const override { return model_; }

    std::vector<std::string> expand(const std::filesystem::path& audio) const;

private:
    std::vector<std::string> command_;
    std::string model_;
};

} // namespace chunkscribe
