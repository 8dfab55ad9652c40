#pragma once

#include <metatree/aggregator.h>
#include <metatree/pipeline.h>

namespace metatree {

inline constexpr int kExitSuccess = 0;
// Usage or configuration error; nothing was run.
inline constexpr int kExitStartFailure = 1;
// Provider fault, cancellation or a store consistency error.
inline constexpr int kExitRunFailed = 2;
// The run completed but every item errored.
inline constexpr int kExitAllItemsFailed = 3;

int RunExitCode(const RunReport &report);
int AggregationExitCode(const AggregationReport &report);

} // namespace metatree
