// Per-job worker tests, driven directly against a registry

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "smart_cut/cut_pipeline.hpp"
#include "smart_cut/job_registry.hpp"
#include "test_helpers.hpp"

namespace smart_cut {
namespace {

using testing_util::FakeProber;
using testing_util::FakeRunner;
using testing_util::TempDir;

class CutPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    input_ = dir_.file("clip.mp4", "media");
    settings_.output_dir = dir_.subdir("out");
    prober_.set(input_, 100.0);

    Job job;
    job.id = "feedface-0000-4000-8000-000000000001";
    job.input_path = input_;
    job.created_at = job.updated_at = Clock::now();
    registry_.admit(job, 1);
  }

  Job Run(std::vector<SegmentInput> deletes) {
    CutPipeline pipeline(kId, input_, std::move(deletes), settings_, prober_,
                         runner_, registry_, [] { return Clock::now(); });
    pipeline.run();
    return *registry_.get(kId);
  }

  const std::string kId = "feedface-0000-4000-8000-000000000001";
  TempDir dir_{"pipeline"};
  std::string input_;
  PipelineSettings settings_;
  FakeProber prober_;
  FakeRunner runner_{&prober_, 42.0};
  JobRegistry registry_;
};

TEST_F(CutPipelineTest, CompletesWithResult) {
  Job j = Run({{0.0, 58.0}});
  ASSERT_EQ(j.status, JobStatus::Completed);
  EXPECT_EQ(j.progress, PROGRESS_DONE);
  ASSERT_TRUE(j.result.has_value());
  EXPECT_DOUBLE_EQ(j.result->new_duration, 42.0);
  EXPECT_DOUBLE_EQ(j.result->compression_ratio, 0.42);
}

TEST_F(CutPipelineTest, MissingInputFailsBeforeFirstMilestone) {
  std::filesystem::remove(input_);
  Job j = Run({{1.0, 2.0}});
  ASSERT_EQ(j.status, JobStatus::Failed);
  EXPECT_EQ(j.progress, 0);
  EXPECT_NE(j.error_message->find("File not found"), std::string::npos);
  EXPECT_EQ(runner_.runs(), 0);
}

TEST_F(CutPipelineTest, ValidationFailureFreezesAtProbeMilestone) {
  // The media got shorter since submission
  prober_.set(input_, 10.0);
  Job j = Run({{20.0, 30.0}});
  ASSERT_EQ(j.status, JobStatus::Failed);
  EXPECT_EQ(j.progress, PROGRESS_DURATION_PROBED);
  EXPECT_NE(j.error_message->find("exceeds media duration"),
            std::string::npos);
}

TEST_F(CutPipelineTest, OutputDirectoryEqualToInputDirectoryFails) {
  settings_.output_dir = dir_.path().string();
  Job j = Run({{1.0, 2.0}});
  ASSERT_EQ(j.status, JobStatus::Failed);
  EXPECT_EQ(j.progress, PROGRESS_SEGMENTS_VALIDATED);
  EXPECT_EQ(runner_.runs(), 0);
}

TEST_F(CutPipelineTest, TerminalStateIsReachedOnce) {
  Job j = Run({{1.0, 2.0}});
  ASSERT_EQ(j.status, JobStatus::Completed);
  // A second run cannot move the job out of its terminal state
  runner_.fail_with(1, "late failure");
  Job again = Run({{1.0, 2.0}});
  EXPECT_EQ(again.status, JobStatus::Completed);
  EXPECT_FALSE(again.error_message.has_value());
}

} // namespace
} // namespace smart_cut
