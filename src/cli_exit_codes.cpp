#include <metatree/cli_exit_codes.h>

namespace metatree {

int RunExitCode(const RunReport &report) {
  switch (report.state) {
  case RunState::kCompleted:
    break;
  case RunState::kPending:
  case RunState::kRunning:
  case RunState::kFailed:
    return kExitRunFailed;
  }
  const auto &summary = report.summary;
  if (summary.Total() > 0 && summary.error == summary.Total()) {
    return kExitAllItemsFailed;
  }
  return kExitSuccess;
}

int AggregationExitCode(const AggregationReport &report) {
  if (!report.subdatasets.empty() &&
      report.FailedCount() == report.subdatasets.size()) {
    return kExitAllItemsFailed;
  }
  return kExitSuccess;
}

} // namespace metatree
