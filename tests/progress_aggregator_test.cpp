#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "caption_suite/progress_aggregator.hpp"
#include "fakes.hpp"

using namespace caption_suite;
using namespace caption_suite::test_support;

class ProgressAggregatorTest : public ::testing::Test {
protected:
  ProgressAggregatorTest()
      : broadcaster_(std::chrono::milliseconds(0)), channel_(64),
        aggregator_(channel_, broadcaster_) {}

  void begin(const std::vector<std::string> &names,
             const std::vector<std::string> &devices) {
    job_ = std::make_unique<Job>(
        "job_test", media(names),
        test_settings(static_cast<int>(devices.size())));
    aggregator_.begin_job(*job_, devices);
  }

  void prepare_all(int devices) {
    for (int i = 0; i < devices; ++i)
      apply(EventKind::DevicePrepared, i);
  }

  void apply(EventKind kind, WorkerId worker, std::size_t task = 0,
             Substage substage = Substage::Idle, double progress = 0,
             int64_t tokens = 0, const std::string &message = "") {
    WorkerEvent event;
    event.kind = kind;
    event.worker = worker;
    event.task_index = task;
    event.substage = substage;
    event.progress = progress;
    event.tokens = tokens;
    event.message = message;
    aggregator_.apply(event);
  }

  Broadcaster broadcaster_;
  EventChannel channel_;
  ProgressAggregator aggregator_;
  std::unique_ptr<Job> job_;
};

TEST_F(ProgressAggregatorTest, IdleBeforeAnyJob) {
  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::Idle);
  EXPECT_TRUE(s.job_id.empty());
  EXPECT_EQ(s.total_videos, 0);
  EXPECT_TRUE(aggregator_.results().empty());
}

TEST_F(ProgressAggregatorTest, LoadingUntilEveryDeviceIsPrepared) {
  begin({"a.mp4", "b.mp4", "c.mp4"}, {"cuda:0", "cuda:1"});

  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::LoadingModel);
  EXPECT_EQ(s.job_id, "job_test");
  EXPECT_EQ(s.total_videos, 3);
  EXPECT_EQ(s.remaining_videos, 3);
  EXPECT_EQ(s.batch_size, 2);
  ASSERT_EQ(s.workers.size(), 2u);
  EXPECT_EQ(s.workers[1].device, "cuda:1");

  apply(EventKind::DevicePrepared, 0);
  EXPECT_EQ(aggregator_.stage(), JobStage::LoadingModel);
  EXPECT_DOUBLE_EQ(aggregator_.snapshot().workers[0].substage_progress, 1.0);

  apply(EventKind::DevicePrepared, 1);
  s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::Processing);
  for (const auto &w : s.workers) {
    EXPECT_TRUE(w.active);
    EXPECT_FALSE(w.current_video.has_value());
    EXPECT_DOUBLE_EQ(w.substage_progress, 0.0);
  }
}

TEST_F(ProgressAggregatorTest, OverallProgressIsFloorPlusActiveFractions) {
  begin({"a.mp4", "b.mp4", "c.mp4", "d.mp4"}, {"cpu", "cpu"});
  prepare_all(2);

  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::Substage, 0, 0, Substage::Generating, 0.5, 20);
  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_NEAR(s.overall_progress, 0.125, 1e-9);
  EXPECT_EQ(s.tokens_generated, 20);
  EXPECT_EQ(s.workers[0].current_video, std::optional<std::string>("a.mp4"));
  EXPECT_EQ(s.workers[0].substage, Substage::Generating);

  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 40, "/out/a.txt");
  s = aggregator_.snapshot();
  EXPECT_NEAR(s.overall_progress, 0.25, 1e-9);
  EXPECT_EQ(s.completed_videos, 1);
  EXPECT_EQ(s.tokens_generated, 40);
  EXPECT_FALSE(s.workers[0].current_video.has_value());

  apply(EventKind::TaskStarted, 1, 1);
  apply(EventKind::Substage, 1, 1, Substage::ExtractingFrames, 0.8);
  EXPECT_NEAR(aggregator_.snapshot().overall_progress, 0.45, 1e-9);

  /// Abandoning the task removes its fraction, but progress never goes back
  apply(EventKind::TaskAbandoned, 1, 1);
  s = aggregator_.snapshot();
  EXPECT_NEAR(s.overall_progress, 0.45, 1e-9);
  EXPECT_EQ(s.remaining_videos, 3);
}

TEST_F(ProgressAggregatorTest, TaskStatusFollowsSubstage) {
  begin({"a.mp4"}, {"cpu"});
  prepare_all(1);

  apply(EventKind::TaskStarted, 0, 0);
  EXPECT_EQ(aggregator_.results()[0].status, TaskStatus::Assigned);
  apply(EventKind::Substage, 0, 0, Substage::ExtractingFrames, 0.1);
  EXPECT_EQ(aggregator_.results()[0].status, TaskStatus::Extracting);
  apply(EventKind::Substage, 0, 0, Substage::Encoding, 0.0);
  EXPECT_EQ(aggregator_.results()[0].status, TaskStatus::Encoding);
  apply(EventKind::Substage, 0, 0, Substage::Generating, 0.2, 5);
  EXPECT_EQ(aggregator_.results()[0].status, TaskStatus::Generating);

  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 30, "/out/a.txt");
  TaskResult r = aggregator_.results()[0];
  EXPECT_EQ(r.status, TaskStatus::Done);
  EXPECT_EQ(r.worker, std::optional<WorkerId>(0));
  EXPECT_EQ(r.output_path, std::optional<std::string>("/out/a.txt"));
  EXPECT_EQ(r.tokens_generated, 30);
}

TEST_F(ProgressAggregatorTest, FinishedTaskIsCountedOnce) {
  begin({"a.mp4", "b.mp4"}, {"cpu"});
  prepare_all(1);

  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 10);
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 10);
  apply(EventKind::TaskFailed, 0, 0, Substage::Idle, 0, 0, "late error");

  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.completed_videos, 1);
  EXPECT_EQ(s.failed_videos, 0);
  EXPECT_EQ(s.tokens_generated, 10);
  EXPECT_EQ(s.remaining_videos, 1);
}

TEST_F(ProgressAggregatorTest, AllTasksFinishedIsComplete) {
  begin({"a.mp4", "b.mp4"}, {"cpu"});
  prepare_all(1);

  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 10);
  apply(EventKind::TaskStarted, 0, 1);
  apply(EventKind::TaskFailed, 0, 1, Substage::Idle, 0, 0, "corrupt");
  apply(EventKind::WorkerExited, 0);
  apply(EventKind::RunFinished, -1);

  ProgressSnapshot s = aggregator_.wait_terminal();
  EXPECT_EQ(s.stage, JobStage::Complete);
  EXPECT_EQ(s.completed_videos, 1);
  EXPECT_EQ(s.failed_videos, 1);
  EXPECT_EQ(s.remaining_videos, 0);
  EXPECT_DOUBLE_EQ(s.overall_progress, 1.0);
  EXPECT_FALSE(s.error_message.has_value());
  EXPECT_FALSE(s.workers[0].active);

  EXPECT_EQ(aggregator_.results()[1].error, std::optional<std::string>("corrupt"));
}

TEST_F(ProgressAggregatorTest, UnfinishedTasksMeanStopped) {
  begin({"a.mp4", "b.mp4", "c.mp4"}, {"cpu"});
  prepare_all(1);

  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 10);
  apply(EventKind::TaskStarted, 0, 1);
  apply(EventKind::Substage, 0, 1, Substage::Generating, 0.4, 8);
  apply(EventKind::TaskAbandoned, 0, 1);
  apply(EventKind::WorkerExited, 0);
  apply(EventKind::RunFinished, -1);

  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::Stopped);
  EXPECT_EQ(s.completed_videos, 1);
  EXPECT_EQ(s.remaining_videos, 2);
  EXPECT_EQ(s.tokens_generated, 10);

  auto results = aggregator_.results();
  EXPECT_EQ(results[0].status, TaskStatus::Done);
  EXPECT_EQ(results[1].status, TaskStatus::Queued);
  EXPECT_FALSE(results[1].worker.has_value());
  EXPECT_EQ(results[2].status, TaskStatus::Queued);
}

TEST_F(ProgressAggregatorTest, StopDuringLoadingIsStopped) {
  begin({"a.mp4"}, {"cuda:0", "cuda:1"});
  apply(EventKind::DevicePrepared, 0);
  apply(EventKind::RunFinished, -1);
  EXPECT_EQ(aggregator_.stage(), JobStage::Stopped);
}

TEST_F(ProgressAggregatorTest, JobFatalMeansError) {
  begin({"a.mp4", "b.mp4"}, {"cpu"});
  prepare_all(1);

  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 10);
  apply(EventKind::JobFatal, 0, 0, Substage::Idle, 0, 0, "cpu: device lost");
  apply(EventKind::JobFatal, -1, 0, Substage::Idle, 0, 0, "second error");
  apply(EventKind::RunFinished, -1);

  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::Error);
  EXPECT_EQ(s.error_message, std::optional<std::string>("cpu: device lost"));
  EXPECT_EQ(s.completed_videos, 1);
}

TEST_F(ProgressAggregatorTest, EventsAfterTerminalAreIgnored) {
  begin({"a.mp4"}, {"cpu"});
  prepare_all(1);
  apply(EventKind::RunFinished, -1);
  ASSERT_EQ(aggregator_.stage(), JobStage::Stopped);

  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 10);

  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::Stopped);
  EXPECT_EQ(s.completed_videos, 0);
  EXPECT_FALSE(s.workers[0].current_video.has_value());
}

TEST_F(ProgressAggregatorTest, ElapsedFreezesAtTerminal) {
  begin({"a.mp4"}, {"cpu"});
  prepare_all(1);
  apply(EventKind::TaskStarted, 0, 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  apply(EventKind::TaskDone, 0, 0, Substage::Idle, 0, 50);
  apply(EventKind::RunFinished, -1);

  ProgressSnapshot first = aggregator_.snapshot();
  EXPECT_GT(first.elapsed_seconds, 0.0);
  EXPECT_GT(first.tokens_per_sec, 0.0);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ProgressSnapshot later = aggregator_.snapshot();
  EXPECT_DOUBLE_EQ(later.elapsed_seconds, first.elapsed_seconds);
  EXPECT_DOUBLE_EQ(later.tokens_per_sec, first.tokens_per_sec);
}

TEST_F(ProgressAggregatorTest, NextJobStartsFromScratch) {
  begin({"a.mp4"}, {"cpu"});
  prepare_all(1);
  apply(EventKind::TaskStarted, 0, 0);
  apply(EventKind::TaskFailed, 0, 0, Substage::Idle, 0, 0, "bad");
  apply(EventKind::RunFinished, -1);
  ASSERT_EQ(aggregator_.stage(), JobStage::Complete);

  begin({"x.mp4", "y.mp4"}, {"cpu"});
  ProgressSnapshot s = aggregator_.snapshot();
  EXPECT_EQ(s.stage, JobStage::LoadingModel);
  EXPECT_EQ(s.total_videos, 2);
  EXPECT_EQ(s.failed_videos, 0);
  EXPECT_DOUBLE_EQ(s.overall_progress, 0.0);
  EXPECT_FALSE(s.error_message.has_value());
}

TEST_F(ProgressAggregatorTest, EventsArriveThroughTheChannel) {
  begin({"a.mp4"}, {"cpu"});

  WorkerEvent prepared;
  prepared.kind = EventKind::DevicePrepared;
  prepared.worker = 0;
  channel_.push(prepared);

  WorkerEvent finished;
  finished.kind = EventKind::RunFinished;
  channel_.push(finished);

  EXPECT_EQ(aggregator_.wait_terminal().stage, JobStage::Stopped);
}
