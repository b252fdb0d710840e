#include "app/job_status.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace momento {
TEST(JobStatusTest, ErrorLogIsCappedWithSingleMarker) {
  std::vector<std::string> errors;
  for (int i = 0; i < 10; ++i) {
    job_status::AppendError(errors, "error " + std::to_string(i), 3);
  }
  ASSERT_EQ(errors.size(), 4u);
  EXPECT_EQ(errors[0], "error 0");
  EXPECT_EQ(errors[2], "error 2");
  EXPECT_EQ(errors[3], job_status::kTruncatedMarker);
}

TEST(JobStatusTest, DefaultCapIsOneHundred) {
  std::vector<std::string> errors;
  for (int i = 0; i < 250; ++i) {
    job_status::AppendError(errors, "e");
  }
  EXPECT_EQ(errors.size(), job_status::kDefaultMaxErrors + 1);
}

TEST(JobStatusTest, ImportStatusJsonShape) {
  ImportJobStatus status;
  status.state_              = JobState::COMPLETED;
  status.total_files_        = 5;
  status.processed_files_    = 5;
  status.successful_imports_ = 3;
  status.skipped_duplicates_ = 1;
  status.failed_imports_     = 1;
  status.started_at_         = "2026-10-19T08:00:00Z";
  status.errors_             = {"Failed to process x.jpg: boom"};

  auto j                     = status.ToJson();
  EXPECT_EQ(j["status"], "completed");
  EXPECT_EQ(j["totalFiles"], 5);
  EXPECT_EQ(j["successfulImports"], 3);
  EXPECT_EQ(j["skippedDuplicates"], 1);
  EXPECT_EQ(j["startedAt"], "2026-10-19T08:00:00Z");
  EXPECT_TRUE(j["completedAt"].is_null());
  EXPECT_EQ(j["errors"].size(), 1u);

  auto back = ImportJobStatus::FromJson(j);
  EXPECT_EQ(back.state_, JobState::COMPLETED);
  EXPECT_EQ(back.failed_imports_, 1u);
  EXPECT_FALSE(back.completed_at_.has_value());
  EXPECT_EQ(back.errors_, status.errors_);
  EXPECT_TRUE(back.IsTerminal());
}

TEST(JobStatusTest, RegenerationStatusFromPartialJson) {
  auto status = RegenerationJobStatus::FromJson(
      nlohmann::json::parse(R"({"status": "running", "totalMedia": 12, "errors": [1, "x"]})"));
  EXPECT_EQ(status.state_, JobState::RUNNING);
  EXPECT_FALSE(status.IsTerminal());
  EXPECT_EQ(status.total_media_, 12u);
  EXPECT_EQ(status.processed_media_, 0u);
  ASSERT_EQ(status.errors_.size(), 1u);
  EXPECT_EQ(status.errors_[0], "x");

  auto j = status.ToJson();
  EXPECT_TRUE(j.contains("generatedThumbnails"));
  EXPECT_TRUE(j.contains("skippedMedia"));
}

TEST(JobStatusTest, StateNames) {
  for (auto state : {JobState::IDLE, JobState::RUNNING, JobState::COMPLETED, JobState::FAILED,
                     JobState::CANCELLED}) {
    EXPECT_EQ(JobStateFromString(JobStateToString(state)), state);
  }
  EXPECT_EQ(JobStateFromString("bogus"), JobState::IDLE);
}
};  // namespace momento
