#include <metatree/cli_exit_codes.h>

#include <gtest/gtest.h>

namespace metatree {
namespace {

RunReport CompletedRun(std::size_t ok, std::size_t error) {
  RunReport report;
  report.state = RunState::kCompleted;
  for (std::size_t i = 0; i < ok; ++i) {
    report.summary.Add(ItemOutcome::kOk);
  }
  for (std::size_t i = 0; i < error; ++i) {
    report.summary.Add(ItemOutcome::kError);
  }
  return report;
}

TEST(RunExitCodeTest, CompletedRunsSucceed) {
  EXPECT_EQ(RunExitCode(CompletedRun(0, 0)), kExitSuccess);
  EXPECT_EQ(RunExitCode(CompletedRun(3, 0)), kExitSuccess);
}

TEST(RunExitCodeTest, PartialFailureStillSucceeds) {
  EXPECT_EQ(RunExitCode(CompletedRun(1, 4)), kExitSuccess);
}

TEST(RunExitCodeTest, EveryItemFailing) {
  EXPECT_EQ(RunExitCode(CompletedRun(0, 2)), kExitAllItemsFailed);
}

TEST(RunExitCodeTest, FailedOrCancelledRuns) {
  auto failed = CompletedRun(5, 0);
  failed.state = RunState::kFailed;
  EXPECT_EQ(RunExitCode(failed), kExitRunFailed);

  failed.cancelled = true;
  EXPECT_EQ(RunExitCode(failed), kExitRunFailed);
}

TEST(AggregationExitCodeTest, FailsOnlyWhenEverySubdatasetFailed) {
  AggregationReport report;
  EXPECT_EQ(AggregationExitCode(report), kExitSuccess);

  SubdatasetAggregation broken;
  broken.ok = false;
  report.subdatasets.push_back(broken);
  EXPECT_EQ(AggregationExitCode(report), kExitAllItemsFailed);

  report.subdatasets.push_back(SubdatasetAggregation{});
  EXPECT_EQ(report.FailedCount(), 1u);
  EXPECT_EQ(AggregationExitCode(report), kExitSuccess);
}

} // namespace
} // namespace metatree
