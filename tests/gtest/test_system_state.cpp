#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "chunkscribe/error.hpp"
#include "chunkscribe/event_publisher.hpp"
#include "chunkscribe/metrics.hpp"
#include "chunkscribe/system_state.hpp"
#include "support/mocks.hpp"

using namespace chunkscribe;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Throw;

TEST(SystemStateTest, WorkerLifecycle) {
    SystemState state;
    state.register_worker("scanner:gdrive");
    EXPECT_EQ(state.worker("scanner:gdrive").status, WorkerStatus::Idle);

    state.update_worker("scanner:gdrive", WorkerStatus::Processing, "c/m/talk_part1.mp3");
    state.set_queue_size("scanner:gdrive", 4);

    auto worker = state.worker("scanner:gdrive");
    EXPECT_EQ(worker.status, WorkerStatus::Processing);
    EXPECT_EQ(worker.current_item, "c/m/talk_part1.mp3");
    EXPECT_EQ(worker.queue_size, 4u);
    EXPECT_EQ(state.workers().size(), 1u);
    EXPECT_STREQ(to_string(WorkerStatus::Waiting), "waiting");
}

TEST(SystemStateTest, SummaryAggregatesPerModel) {
    SystemState state;
    state.record_transcription("tiny", 15.0, 30.0);
    state.record_transcription("tiny", 15.0, 60.0);
    state.record_transcription("base", 10.0, 50.0);
    state.record_process("c/m/a", 100.0);
    state.record_process("c/m/b", 300.0);

    auto summary = state.summary();
    EXPECT_DOUBLE_EQ(summary.seconds_per_audio_minute.at("tiny"), 3.0);
    EXPECT_DOUBLE_EQ(summary.seconds_per_audio_minute.at("base"), 5.0);
    EXPECT_DOUBLE_EQ(summary.average_process_seconds, 200.0);
    EXPECT_EQ(summary.transcription_samples, 3u);
    EXPECT_EQ(summary.process_samples, 2u);
}

TEST(SystemStateTest, RingsAreBounded) {
    SystemState state(2, 2);
    for (int i = 0; i < 5; ++i) {
        state.record_process("g" + std::to_string(i), i);
        state.record_event(NotificationEvent{EventKind::MergeCompleted, "g" + std::to_string(i), ""});
    }
    auto samples = state.process_samples();
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples.front().group, "g3");
    EXPECT_EQ(samples.back().group, "g4");

    auto events = state.recent_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events.front().event.subject, "g3");
}

TEST(SystemStateTest, RejectsZeroCapacity) {
    EXPECT_THROW(SystemState(0, 10), InvalidArgumentError);
    EXPECT_THROW(SystemState(10, 0), InvalidArgumentError);
}

TEST(SystemStateTest, CountersAndSnapshot) {
    SystemState state;
    state.increment_files_processed();
    state.increment_files_processed();
    state.increment_groups_merged();
    state.increment_transcription_failures();
    state.increment_dead_lettered();
    state.register_worker("upload");

    auto snap = state.snapshot();
    EXPECT_EQ(snap.counters.files_processed, 2u);
    EXPECT_EQ(snap.counters.groups_merged, 1u);
    EXPECT_EQ(snap.counters.transcription_failures, 1u);
    EXPECT_EQ(snap.counters.segments_dead_lettered, 1u);
    EXPECT_EQ(snap.workers.count("upload"), 1u);
}

TEST(MetricsExportTest, PrometheusText) {
    SystemState state;
    state.register_worker("scanner:gdrive");
    state.set_queue_size("scanner:gdrive", 3);
    state.increment_groups_merged();
    state.record_transcription("tiny", 15.0, 45.0);
    state.record_process("c/m/a", 12.5);

    const std::string text = export_prometheus(state.snapshot());
    EXPECT_THAT(text, HasSubstr("# TYPE chunkscribe_groups_merged_total counter\nchunkscribe_groups_merged_total 1\n"));
    EXPECT_THAT(text, HasSubstr("chunkscribe_worker_queue_size{worker=\"scanner:gdrive\"} 3\n"));
    EXPECT_THAT(text, HasSubstr("chunkscribe_worker_status{worker=\"scanner:gdrive\",status=\"idle\"} 1\n"));
    EXPECT_THAT(text, HasSubstr("chunkscribe_seconds_per_audio_minute{model=\"tiny\"} 3.000000\n"));
    EXPECT_THAT(text, HasSubstr("chunkscribe_average_process_seconds 12.500000\n"));
}

TEST(MetricsExportTest, ScopedTimerIsMonotonic) {
    ScopedTimer timer;
    const double first = timer.elapsed_seconds();
    EXPECT_GE(first, 0.0);
    EXPECT_GE(timer.elapsed_seconds(), first);
}

TEST(EventPublisherTest, RecordsAndForwards) {
    auto state = std::make_shared<SystemState>();
    auto notifier = std::make_shared<test::MockNotifier>();
    EventPublisher publisher(state, notifier);

    EXPECT_CALL(*notifier, notify(_)).Times(1);
    publisher.publish(EventKind::CourseFinished, "bio", "all recordings of the course are transcribed");

    auto events = state->recent_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event.kind, EventKind::CourseFinished);
    EXPECT_EQ(events[0].event.subject, "bio");
}

TEST(EventPublisherTest, NotifierFailureDoesNotPropagate) {
    auto state = std::make_shared<SystemState>();
    auto notifier = std::make_shared<test::MockNotifier>();
    EventPublisher publisher(state, notifier);

    EXPECT_CALL(*notifier, notify(_)).WillOnce(Throw(std::runtime_error("network down")));
    EXPECT_NO_THROW(publisher.publish(EventKind::Error, "c/m/talk", "merge failed"));
    EXPECT_EQ(state->recent_events().size(), 1u);
}
