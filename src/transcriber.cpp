#include "chunkscribe/transcriber.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/logging.hpp"

#include <boost/process.hpp>

#include <istream>

namespace bp = boost::process;

namespace chunkscribe {

namespace {

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

CommandTranscriber::CommandTranscriber(std::vector<std::string> command, std::string model)
    : command_(std::move(command)), model_(std::move(model)) {
    CHUNKSCRIBE_CHECK_ARGUMENT(!command_.empty() && !command_.front().empty(),
                               "transcription command must not be empty");
}

std::vector<std::string> CommandTranscriber::expand(const std::filesystem::path& audio) const {
    std::vector<std::string> argv = command_;
    for (auto& arg : argv) {
        replace_all(arg, "{input}", audio.string());
        replace_all(arg, "{model}", model_);
    }
    return argv;
}

std::string CommandTranscriber::transcribe(const std::filesystem::path& audio) {
    const auto argv = expand(audio);
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    boost::filesystem::path program = argv.front();
    if (program.parent_path().empty()) {
        program = bp::search_path(argv.front());
        if (program.empty()) {
            throw TranscriptionError("program not found on PATH: " + argv.front(), audio.string());
        }
    }

    LOG_DEBUG("Running ", program.string(), " for ", audio.string());

    std::string output;
    int exit_code = 0;
    try {
        bp::ipstream out;
        bp::child child(program, bp::args(args), bp::std_in < bp::null, bp::std_out > out, bp::std_err > bp::null);

        std::string line;
        while (std::getline(out, line)) {
            output += line;
            output += '\n';
        }
        child.wait();
        exit_code = child.exit_code();
    } catch (const bp::process_error& e) {
        throw TranscriptionError(std::string("cannot run transcription command: ") + e.what(), audio.string());
    }

    if (exit_code != 0) {
        throw TranscriptionError("transcription command exited with status " + std::to_string(exit_code),
                                 audio.string());
    }
    return output;
}

} // namespace chunkscribe
