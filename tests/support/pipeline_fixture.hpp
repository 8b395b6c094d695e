#pragma once

#include "chunkscribe/pipeline.hpp"
#include "support/mocks.hpp"
#include "support/temp_dir.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace chunkscribe::test {

// Two intake roots (gdrive above web), filesystem fragments and output under
// one temp dir, and a mock transcriber returning "text of <stem>".
class PipelineFixture : public ::testing::Test {
protected:
    void SetUp() override {
        roots_ = {{"gdrive", dir_ / "gdrive", 70}, {"web", dir_ / "web", 30}};
        for (const auto& root : roots_) {
            std::filesystem::create_directories(root.path);
        }

        transcriber_ = std::make_shared<::testing::NiceMock<MockTranscriber>>();
        ON_CALL(*transcriber_, transcribe(::testing::_))
            .WillByDefault(::testing::Invoke([](const std::filesystem::path& audio) {
                return "text of " + audio.stem().string();
            }));
        ON_CALL(*transcriber_, model_name()).WillByDefault(::testing::Return("tiny"));

        build(std::make_shared<FilesystemFragmentStore>(dir_ / "parts", IdentityResolver()));
    }

    void build(std::shared_ptr<FragmentStore> store, RetryConfig retry = {2, 60, 3600}, std::size_t slots = 1) {
        store_ = std::move(store);
        state_ = std::make_shared<SystemState>();
        notifier_ = std::make_shared<::testing::NiceMock<MockNotifier>>();
        events_ = std::make_shared<EventPublisher>(state_, notifier_);
        cleanup_ = make_cleanup(events_);
        merge_ = std::make_shared<MergeEngine>(dir_ / "output", store_, cleanup_, events_);
        group_claims_ = std::make_shared<ClaimRegistry>();
        pipeline_ = make_pipeline(store_, state_, events_, cleanup_, merge_, group_claims_, retry, slots);
    }

    // A second pipeline over the same directories with its own claims, state
    // and events, the way a separate process builds one.
    std::shared_ptr<SegmentPipeline> build_peer(std::shared_ptr<FragmentStore> store,
                                                std::shared_ptr<SystemState> state) {
        auto events = std::make_shared<EventPublisher>(state, nullptr);
        auto cleanup = make_cleanup(events);
        auto merge = std::make_shared<MergeEngine>(dir_ / "output", store, cleanup, events);
        return make_pipeline(store, state, events, cleanup, merge, std::make_shared<ClaimRegistry>(),
                             RetryConfig{2, 60, 3600}, 1);
    }
    // Creates an audio file under root index and returns its path.
    std::filesystem::path add_segment(std::size_t root, const std::string& relative) {
        const auto path = roots_.at(root).path / relative;
        write_file(path, "audio");
        return path;
    }

    Outcome process(const std::filesystem::path& path, std::size_t root = 0) {
        return pipeline_->process(Candidate{path, root, Origin::Scan}, "test");
    }

    std::filesystem::path lock_root() const { return dir_.path() / "output" / ".locks"; }
    std::filesystem::path artifact(const std::string& relative) const { return dir_.path() / "output" / relative; }

    std::shared_ptr<CleanupAgent> make_cleanup(std::shared_ptr<EventPublisher> events) const {
        return std::make_shared<CleanupAgent>(roots_, dir_ / "parts", IdentityResolver(),
                                              std::vector<std::string>{".mp3", ".wav"}, std::move(events));
    }

    std::shared_ptr<SegmentPipeline> make_pipeline(std::shared_ptr<FragmentStore> store,
                                                   std::shared_ptr<SystemState> state,
                                                   std::shared_ptr<EventPublisher> events,
                                                   std::shared_ptr<CleanupAgent> cleanup,
                                                   std::shared_ptr<MergeEngine> merge,
                                                   std::shared_ptr<ClaimRegistry> group_claims,
                                                   RetryConfig retry, std::size_t slots) const {
        PipelineComponents components;
        components.store = std::move(store);
        components.transcriber = transcriber_;
        components.cleanup = std::move(cleanup);
        components.merge = std::move(merge);
        components.group_claims = std::move(group_claims);
        components.segment_claims = std::make_shared<ClaimRegistry>();
        components.retries = std::make_shared<RetryTracker>(retry);
        components.slots = std::make_shared<ComputeSlots>(slots);
        components.state = std::move(state);
        components.events = std::move(events);
        components.lock_root = lock_root();
        components.lock_wait = std::chrono::milliseconds(0);
        return std::make_shared<SegmentPipeline>(std::move(components));
    }

    TempDir dir_;
    std::vector<IntakeRoot> roots_;
    std::shared_ptr<::testing::NiceMock<MockTranscriber>> transcriber_;
    std::shared_ptr<FragmentStore> store_;
    std::shared_ptr<SystemState> state_;
    std::shared_ptr<::testing::NiceMock<MockNotifier>> notifier_;
    std::shared_ptr<EventPublisher> events_;
    std::shared_ptr<CleanupAgent> cleanup_;
    std::shared_ptr<MergeEngine> merge_;
    std::shared_ptr<ClaimRegistry> group_claims_;
    std::shared_ptr<SegmentPipeline> pipeline_;
};

} // namespace chunkscribe::test
