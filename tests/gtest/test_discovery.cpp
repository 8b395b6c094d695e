#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "chunkscribe/discovery.hpp"
#include "chunkscribe/error.hpp"
#include "support/log_capture.hpp"
#include "support/pipeline_fixture.hpp"

#include <chrono>
#include <thread>

using namespace chunkscribe;
using namespace std::chrono_literals;
using ::testing::_;

TEST(CandidateQueueTest, DeduplicatesQueuedPaths) {
    CandidateQueue queue;
    EXPECT_TRUE(queue.push(Candidate{"/in/a_part1.mp3", 0, Origin::Scan}));
    EXPECT_FALSE(queue.push(Candidate{"/in/a_part1.mp3", 0, Origin::Upload}));
    EXPECT_TRUE(queue.push(Candidate{"/in/a_part2.mp3", 0, Origin::Scan}));
    EXPECT_EQ(queue.size(), 2u);

    Candidate taken;
    ASSERT_TRUE(queue.try_pop(taken));
    EXPECT_EQ(taken.segment, std::filesystem::path("/in/a_part1.mp3"));
    // Once taken, the same path may be queued again.
    EXPECT_TRUE(queue.push(Candidate{"/in/a_part1.mp3", 0, Origin::Scan}));
    queue.done();
}

TEST(CandidateQueueTest, StopReleasesBlockedConsumer) {
    CandidateQueue queue;
    bool popped = true;
    std::thread consumer([&] {
        Candidate candidate;
        popped = queue.pop(candidate);
    });
    std::this_thread::sleep_for(10ms);
    queue.stop();
    consumer.join();

    EXPECT_FALSE(popped);
    EXPECT_FALSE(queue.push(Candidate{"/in/x_part1.mp3", 0, Origin::Scan}));
}

class DiscoveryTest : public test::PipelineFixture {
protected:
    void SetUp() override {
        PipelineFixture::SetUp();
        worker_ = std::make_shared<DiscoveryWorker>("scanner:gdrive", pipeline_, state_);
        scanner_ = std::make_unique<DirectoryScanner>(0, roots_[0], IdentityResolver(), cleanup_, store_, merge_,
                                                      worker_, 3600s);
    }

    void TearDown() override {
        scanner_.reset();
        worker_.reset();
    }

    std::shared_ptr<DiscoveryWorker> worker_;
    std::unique_ptr<DirectoryScanner> scanner_;
};

TEST_F(DiscoveryTest, WorkerRegistersItself) {
    EXPECT_EQ(state_->workers().count("scanner:gdrive"), 1u);
    EXPECT_FALSE(worker_->running());
}

TEST_F(DiscoveryTest, ScanQueuesUntranscribedSegmentsAndWholeFiles) {
    add_segment(0, "c/m/talk_part1.mp3");
    add_segment(0, "c/m/talk_part2.mp3");
    add_segment(0, "c/lone.wav");
    add_segment(0, "c/m/notes.txt");

    EXPECT_EQ(scanner_->scan_once(), 3u);
    EXPECT_EQ(worker_->queued(), 3u);
    EXPECT_EQ(scanner_->pending_segments(), 3u);
}

TEST_F(DiscoveryTest, ScanSkipsDirectoriesBelowModule) {
    add_segment(0, "c/m/deeper/talk_part1.mp3");
    add_segment(0, "c/m/deeper/still/talk_part2.mp3");
    test::LogCapture log(dir_ / "scan.log");

    EXPECT_EQ(scanner_->scan_once(), 0u);
    EXPECT_EQ(scanner_->pending_segments(), 0u);

    const std::string text = log.text();
    EXPECT_NE(text.find("deeper than course/module"), std::string::npos);
    EXPECT_EQ(text.find("still"), std::string::npos);
}

TEST_F(DiscoveryTest, TranscribedGroupIsRevisitedOnce) {
    add_segment(0, "c/m/talk_part1.mp3");
    add_segment(0, "c/m/talk_part2.mp3");
    GroupKey key{"c", "m", "talk"};
    store_->write(key, 1, "one");
    store_->write(key, 2, "two");

    EXPECT_EQ(scanner_->scan_once(), 1u);
    EXPECT_EQ(scanner_->pending_segments(), 0u);

    EXPECT_CALL(*transcriber_, transcribe(_)).Times(0);
    EXPECT_EQ(worker_->drain(), 1u);
    EXPECT_EQ(test::read_file(artifact("c/m/talk.txt")), "one\n\ntwo");
}

TEST_F(DiscoveryTest, FinalizedGroupsAreNotQueued) {
    add_segment(0, "c/m/talk_part1.mp3");
    test::write_file(artifact("c/m/talk.txt"), "done");

    EXPECT_EQ(scanner_->scan_once(), 0u);
}

TEST_F(DiscoveryTest, ScanThenDrainCompletesGroup) {
    add_segment(0, "c/m/talk_part2.mp3");
    add_segment(0, "c/m/talk_part1.mp3");

    scanner_->scan_once();
    EXPECT_EQ(worker_->drain(), 2u);

    EXPECT_EQ(test::read_file(artifact("c/m/talk.txt")), "text of talk_part1\n\ntext of talk_part2");
    EXPECT_EQ(state_->worker("scanner:gdrive").status, WorkerStatus::Waiting);
    EXPECT_EQ(scanner_->scan_once(), 0u);
}

TEST_F(DiscoveryTest, StartedWorkerProcessesQueue) {
    const auto path = add_segment(0, "c/m/seminar.mp3");
    worker_->start();
    EXPECT_TRUE(worker_->running());

    EXPECT_TRUE(worker_->enqueue(Candidate{path, 0, Origin::Scan}));
    worker_->wait_idle();
    worker_->stop();

    EXPECT_FALSE(worker_->running());
    EXPECT_EQ(test::read_file(artifact("c/m/seminar.txt")), "text of seminar");
}

TEST_F(DiscoveryTest, WorkerSurvivesPipelineExceptions) {
    const auto path = add_segment(0, "c/m/talk_part1.mp3");
    EXPECT_CALL(*transcriber_, transcribe(_)).WillOnce(::testing::Throw(std::runtime_error("bad alloc")));

    worker_->enqueue(Candidate{path, 0, Origin::Scan});
    EXPECT_EQ(worker_->drain(), 1u);
    EXPECT_EQ(state_->worker("scanner:gdrive").status, WorkerStatus::Error);
}

TEST_F(DiscoveryTest, StartedScannerRunsFirstPassImmediately) {
    add_segment(0, "c/m/talk_part1.mp3");
    scanner_->start();
    for (int i = 0; i < 200 && worker_->queued() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    scanner_->stop();
    EXPECT_EQ(worker_->queued(), 1u);
}

TEST_F(DiscoveryTest, UploadTriggerRoutesToContainingRoot) {
    auto upload_worker = std::make_shared<DiscoveryWorker>("upload", pipeline_, state_);
    UploadTrigger trigger(roots_, upload_worker);
    const auto path = add_segment(1, "uploads/voice_part1.mp3");

    EXPECT_TRUE(trigger.submit(path));
    EXPECT_FALSE(trigger.submit(path));
    EXPECT_EQ(upload_worker->drain(), 1u);
    EXPECT_EQ(test::read_file(artifact("uploads/voice.txt")), "text of voice_part1");
}

TEST_F(DiscoveryTest, UploadOutsideRootsIsRejected) {
    auto upload_worker = std::make_shared<DiscoveryWorker>("upload", pipeline_, state_);
    UploadTrigger trigger(roots_, upload_worker);
    EXPECT_THROW(trigger.submit(dir_ / "elsewhere/voice_part1.mp3"), InvalidArgumentError);
    EXPECT_EQ(upload_worker->queued(), 0u);
}
