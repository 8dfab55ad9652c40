#pragma once

#include <metatree/dataset_repository.h>
#include <metatree/logging.h>
#include <metatree/models.h>
#include <metatree/record_codec.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

class ComponentRegistry;
class MetadataStore;

enum class ItemOutcome { kOk, kNotNeeded, kImpossible, kError };
enum class RunState { kPending, kRunning, kCompleted, kFailed };

std::string ToString(ItemOutcome outcome);
std::string ToString(RunState state);

enum class WorkItemKind { kDataset, kFile, kRecord };

std::string ToString(WorkItemKind kind);

struct WorkItem {
  WorkItemKind kind = WorkItemKind::kFile;
  // Display name: tree path for dataset and file items, "line N" for records.
  std::string path;
  // Set for dataset and file items.
  std::optional<TreeEntry> entry;
  // The dataset of a dataset item, the containing dataset of a file item.
  std::shared_ptr<const DatasetRepository> dataset;
  // Set for record items.
  std::optional<nlohmann::json> record;
};

// A work item and the records its stages produced so far.
struct PipelineItem {
  WorkItem work;
  std::vector<WireRecord> records;
};

struct StageResult {
  ItemOutcome outcome = ItemOutcome::kOk;
  std::string message;
};

struct PipelineContext {
  const std::atomic<bool> *stop_requested = nullptr;
  std::shared_ptr<Logger> logger;

  bool StopRequested() const {
    return stop_requested != nullptr && stop_requested->load();
  }
};

// Lazy, finite source of work items. Exceptions from Next() fail the run.
class Provider {
public:
  virtual ~Provider() = default;
  virtual std::string Name() const = 0;
  // std::nullopt once exhausted.
  virtual std::optional<WorkItem> Next() = 0;
};

class Processor {
public:
  virtual ~Processor() = default;
  virtual std::string Name() const = 0;
  // Processors that are not safe are never invoked by two workers at once.
  virtual bool IsConcurrencySafe() const = 0;
  // Anything but kOk ends the chain for this item. Exceptions become kError.
  virtual StageResult Process(PipelineItem &item,
                              const PipelineContext &context) = 0;
};

struct ItemReport {
  std::string item;
  WorkItemKind kind = WorkItemKind::kFile;
  ItemOutcome outcome = ItemOutcome::kOk;
  std::string message;
  // Processor that decided the outcome.
  std::string stage;
  std::vector<WireRecord> records;
};

nlohmann::json ToJson(const ItemReport &report);

struct RunSummary {
  std::size_t ok = 0;
  std::size_t not_needed = 0;
  std::size_t impossible = 0;
  std::size_t error = 0;

  void Add(ItemOutcome outcome);
  std::size_t Count(ItemOutcome outcome) const;
  std::size_t Total() const { return ok + not_needed + impossible + error; }
};

struct RunReport {
  RunState state = RunState::kPending;
  bool cancelled = false;
  std::string failure_reason;
  RunSummary summary;
  // Per-item reports, kept only for runs without an observer.
  std::vector<ItemReport> items;
};

nlohmann::json ToJson(const RunSummary &summary);
// State, cancellation, failure reason and counts; items are left out.
nlohmann::json SummaryJson(const RunReport &report);

struct ConductOptions {
  std::size_t jobs = 1;
  // 0 selects twice the number of jobs.
  std::size_t queue_capacity = 0;
};

using StageArguments = std::map<std::string, std::string>;

// Typed access to stage arguments. Malformed values throw
// ConfigurationError.
std::optional<std::string> StringArgument(const StageArguments &arguments,
                                          const std::string &key);
bool BoolArgument(const StageArguments &arguments, const std::string &key,
                  bool fallback);
std::optional<std::size_t> SizeArgument(const StageArguments &arguments,
                                        const std::string &key);

// What stage factories may use to build their component.
struct ConductEnvironment {
  std::shared_ptr<const DatasetRepository> dataset;
  std::shared_ptr<MetadataStore> store;
  const ComponentRegistry *registry = nullptr;
  AgentInfo agent;
  std::chrono::milliseconds extractor_timeout{60000};
  // Source of the json-lines provider when its "input" is "-".
  std::istream *input = nullptr;
  std::shared_ptr<Logger> logger;
};

} // namespace metatree
