#include <metatree/conductor.h>

#include <metatree/errors.h>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace metatree {

Conductor::Conductor(std::unique_ptr<Provider> provider,
                     std::vector<std::unique_ptr<Processor>> processors,
                     ConductOptions options, std::shared_ptr<Logger> logger)
    : provider_(std::move(provider)), processors_(std::move(processors)),
      options_(options), logger_(EnsureLogger(std::move(logger))) {
  if (!provider_) {
    throw ConfigurationError("A pipeline needs a provider");
  }
  for (const auto &processor : processors_) {
    if (!processor) {
      throw ConfigurationError("Pipeline processor cannot be null");
    }
    processor_mutexes_.push_back(std::make_unique<std::mutex>());
  }
  if (options_.jobs == 0) {
    throw ConfigurationError("jobs must be > 0");
  }
  if (options_.queue_capacity == 0) {
    options_.queue_capacity = 2 * options_.jobs;
  }
}

Conductor::~Conductor() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    closed_ = true;
    queue_.clear();
  }
  queue_not_empty_.notify_all();
  queue_not_full_.notify_all();
  JoinWorkers();
}

void Conductor::JoinWorkers() {
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void Conductor::RequestStop() {
  if (stop_requested_.exchange(true)) {
    return;
  }
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    dropped = queue_.size();
    queue_.clear();
  }
  queue_not_empty_.notify_all();
  queue_not_full_.notify_all();
  logger_->Log(LogLevel::kWarn, "conduct.stop",
               {{"dropped_items", std::to_string(dropped)}});
}

bool Conductor::Enqueue(PipelineItem item) {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  queue_not_full_.wait(lock, [&] {
    return stop_requested_.load() || queue_.size() < options_.queue_capacity;
  });
  if (stop_requested_.load()) {
    return false;
  }
  queue_.push_back(std::move(item));
  lock.unlock();
  queue_not_empty_.notify_one();
  return true;
}

void Conductor::WorkerLoop() {
  while (true) {
    PipelineItem item;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      item = std::move(queue_.front());
      queue_.pop_front();
    }
    queue_not_full_.notify_one();
    Finish(ProcessItem(item));
  }
}

ItemReport Conductor::ProcessItem(PipelineItem &item) {
  const PipelineContext context{&stop_requested_, logger_};
  ItemReport report;
  report.item = item.work.path;
  report.kind = item.work.kind;

  for (std::size_t i = 0; i < processors_.size(); ++i) {
    auto &processor = *processors_[i];
    report.stage = processor.Name();
    StageResult result;
    try {
      if (processor.IsConcurrencySafe()) {
        result = processor.Process(item, context);
      } else {
        std::lock_guard<std::mutex> lock(*processor_mutexes_[i]);
        result = processor.Process(item, context);
      }
    } catch (const std::exception &error) {
      result = StageResult{ItemOutcome::kError, error.what()};
    }
    report.outcome = result.outcome;
    report.message = std::move(result.message);
    if (result.outcome != ItemOutcome::kOk) {
      break;
    }
  }
  report.records = std::move(item.records);

  logger_->Log(report.outcome == ItemOutcome::kError ? LogLevel::kWarn
                                                     : LogLevel::kDebug,
               "conduct.item",
               {{"item", report.item},
                {"status", ToString(report.outcome)},
                {"stage", report.stage},
                {"message", report.message}});
  return report;
}

void Conductor::Finish(ItemReport report) {
  std::lock_guard<std::mutex> lock(report_mutex_);
  report_.summary.Add(report.outcome);
  if (observer_ == nullptr || !*observer_) {
    report_.items.push_back(std::move(report));
    return;
  }
  try {
    (*observer_)(report);
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kError, "conduct.observer.error",
                 {{"item", report.item}, {"error", error.what()}});
  }
}

RunReport Conductor::Run(const ItemObserver &observer) {
  auto expected = RunState::kPending;
  if (!state_.compare_exchange_strong(expected, RunState::kRunning)) {
    throw std::logic_error("A pipeline can only be run once");
  }
  observer_ = &observer;
  report_.state = RunState::kRunning;

  logger_->Log(LogLevel::kInfo, "conduct.start",
               {{"provider", provider_->Name()},
                {"processors", std::to_string(processors_.size())},
                {"jobs", std::to_string(options_.jobs)},
                {"queue_capacity", std::to_string(options_.queue_capacity)}});
  const auto started = std::chrono::steady_clock::now();

  for (std::size_t i = 0; i < options_.jobs; ++i) {
    workers_.emplace_back(&Conductor::WorkerLoop, this);
  }

  std::string failure;
  while (!stop_requested_.load()) {
    std::optional<WorkItem> work;
    try {
      work = provider_->Next();
    } catch (const std::exception &error) {
      failure = std::string("Provider ") + provider_->Name() +
                " failed: " + error.what();
      logger_->Log(LogLevel::kError, "conduct.provider.error",
                   {{"provider", provider_->Name()}, {"error", error.what()}});
      break;
    }
    if (!work) {
      break;
    }
    if (!Enqueue(PipelineItem{std::move(*work), {}})) {
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    closed_ = true;
  }
  queue_not_empty_.notify_all();
  JoinWorkers();

  RunReport report;
  {
    std::lock_guard<std::mutex> lock(report_mutex_);
    observer_ = nullptr;
    report = std::move(report_);
  }
  if (!failure.empty()) {
    report.state = RunState::kFailed;
    report.failure_reason = std::move(failure);
  } else if (stop_requested_.load()) {
    report.state = RunState::kFailed;
    report.cancelled = true;
    report.failure_reason = "Run was stopped";
  } else {
    report.state = RunState::kCompleted;
  }
  state_.store(report.state);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();
  logger_->Log(LogLevel::kInfo, "conduct.complete",
               {{"state", ToString(report.state)},
                {"duration_ms", std::to_string(duration_ms)},
                {"ok", std::to_string(report.summary.ok)},
                {"notneeded", std::to_string(report.summary.not_needed)},
                {"impossible", std::to_string(report.summary.impossible)},
                {"error", std::to_string(report.summary.error)}});
  return report;
}

} // namespace metatree
