#include <gtest/gtest.h>

#include "chunkscribe/error.hpp"
#include "chunkscribe/transcriber.hpp"
#include "support/temp_dir.hpp"

using namespace chunkscribe;

TEST(CommandTranscriberTest, ExpandsPlaceholders) {
    CommandTranscriber transcriber({"whisper-cli", "-m", "models/ggml-{model}.bin", "-f", "{input}"}, "base");
    const auto argv = transcriber.expand("/in/c/m/talk_part1.mp3");
    ASSERT_EQ(argv.size(), 5u);
    EXPECT_EQ(argv[2], "models/ggml-base.bin");
    EXPECT_EQ(argv[4], "/in/c/m/talk_part1.mp3");
    EXPECT_EQ(transcriber.model_name(), "base");
}

TEST(CommandTranscriberTest, CapturesStandardOutput) {
    test::TempDir dir;
    const auto audio = dir / "talk_part1.mp3";
    test::write_file(audio, "first line\nsecond line\n");

    CommandTranscriber transcriber({"cat", "{input}"}, "tiny");
    EXPECT_EQ(transcriber.transcribe(audio), "first line\nsecond line\n");
}

TEST(CommandTranscriberTest, NonZeroExitIsTranscriptionError) {
    CommandTranscriber transcriber({"sh", "-c", "exit 3"}, "tiny");
    EXPECT_THROW(transcriber.transcribe("/in/talk_part1.mp3"), TranscriptionError);
}

TEST(CommandTranscriberTest, UnknownProgramIsTranscriptionError) {
    CommandTranscriber transcriber({"chunkscribe-no-such-transcriber"}, "tiny");
    EXPECT_THROW(transcriber.transcribe("/in/talk_part1.mp3"), TranscriptionError);
}

TEST(CommandTranscriberTest, RejectsEmptyCommand) {
    EXPECT_THROW(CommandTranscriber({}, "tiny"), InvalidArgumentError);
}
