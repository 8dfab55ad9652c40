#include <metatree/pipeline.h>

#include <metatree/errors.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace metatree {

std::string ToString(ItemOutcome outcome) {
  switch (outcome) {
  case ItemOutcome::kOk:
    return "ok";
  case ItemOutcome::kNotNeeded:
    return "notneeded";
  case ItemOutcome::kImpossible:
    return "impossible";
  case ItemOutcome::kError:
    return "error";
  }
  return "error";
}

std::string ToString(RunState state) {
  switch (state) {
  case RunState::kPending:
    return "pending";
  case RunState::kRunning:
    return "running";
  case RunState::kCompleted:
    return "completed";
  case RunState::kFailed:
    return "failed";
  }
  return "failed";
}

std::string ToString(WorkItemKind kind) {
  switch (kind) {
  case WorkItemKind::kDataset:
    return "dataset";
  case WorkItemKind::kFile:
    return "file";
  case WorkItemKind::kRecord:
    return "record";
  }
  return "record";
}

nlohmann::json ToJson(const ItemReport &report) {
  nlohmann::json object = {{"item", report.item},
                           {"type", ToString(report.kind)},
                           {"status", ToString(report.outcome)},
                           {"stage", report.stage}};
  if (!report.message.empty()) {
    object["message"] = report.message;
  }
  if (!report.records.empty()) {
    auto records = nlohmann::json::array();
    for (const auto &record : report.records) {
      records.push_back(ToWireJson(record));
    }
    object["metadata"] = std::move(records);
  }
  return object;
}

void RunSummary::Add(ItemOutcome outcome) {
  switch (outcome) {
  case ItemOutcome::kOk:
    ++ok;
    break;
  case ItemOutcome::kNotNeeded:
    ++not_needed;
    break;
  case ItemOutcome::kImpossible:
    ++impossible;
    break;
  case ItemOutcome::kError:
    ++error;
    break;
  }
}

std::size_t RunSummary::Count(ItemOutcome outcome) const {
  switch (outcome) {
  case ItemOutcome::kOk:
    return ok;
  case ItemOutcome::kNotNeeded:
    return not_needed;
  case ItemOutcome::kImpossible:
    return impossible;
  case ItemOutcome::kError:
    return error;
  }
  return 0;
}

nlohmann::json ToJson(const RunSummary &summary) {
  return {{"ok", summary.ok},
          {"notneeded", summary.not_needed},
          {"impossible", summary.impossible},
          {"error", summary.error},
          {"total", summary.Total()}};
}

nlohmann::json SummaryJson(const RunReport &report) {
  nlohmann::json object = {{"state", ToString(report.state)},
                           {"cancelled", report.cancelled},
                           {"counts", ToJson(report.summary)}};
  if (!report.failure_reason.empty()) {
    object["failure_reason"] = report.failure_reason;
  }
  return object;
}

std::optional<std::string> StringArgument(const StageArguments &arguments,
                                          const std::string &key) {
  const auto found = arguments.find(key);
  if (found == arguments.end()) {
    return std::nullopt;
  }
  return found->second;
}

bool BoolArgument(const StageArguments &arguments, const std::string &key,
                  bool fallback) {
  auto value = StringArgument(arguments, key);
  if (!value) {
    return fallback;
  }
  std::transform(value->begin(), value->end(), value->begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (*value == "true" || *value == "yes" || *value == "1" || value->empty()) {
    return true;
  }
  if (*value == "false" || *value == "no" || *value == "0") {
    return false;
  }
  throw ConfigurationError("Argument '" + key + "' expects a boolean, got '" +
                           *value + "'");
}

std::optional<std::size_t> SizeArgument(const StageArguments &arguments,
                                        const std::string &key) {
  const auto value = StringArgument(arguments, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->empty() ||
      !std::all_of(value->begin(), value->end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ConfigurationError("Argument '" + key +
                             "' expects a non-negative number, got '" + *value +
                             "'");
  }
  try {
    return static_cast<std::size_t>(std::stoull(*value));
  } catch (const std::out_of_range &) {
    throw ConfigurationError("Argument '" + key + "' is out of range");
  }
}

} // namespace metatree
