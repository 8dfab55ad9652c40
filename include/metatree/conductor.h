#pragma once

#include <metatree/logging.h>
#include <metatree/pipeline.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace metatree {

// Runs one provider and an ordered processor chain. The provider is drained
// on the calling thread into a bounded queue and blocks while the queue is
// full; `jobs` workers take items from the queue and pass each through the
// whole chain. Items complete in any order.
class Conductor {
public:
  // Called once per finished item, never concurrently.
  using ItemObserver = std::function<void(const ItemReport &)>;

  Conductor(std::unique_ptr<Provider> provider,
            std::vector<std::unique_ptr<Processor>> processors,
            ConductOptions options, std::shared_ptr<Logger> logger = nullptr);
  ~Conductor();

  Conductor(const Conductor &) = delete;
  Conductor &operator=(const Conductor &) = delete;

  // May be called once. Item failures are reported, not thrown. With an
  // observer each ItemReport goes to it and only the summary is kept.
  RunReport Run(const ItemObserver &observer = {});

  // Stops scheduling: queued items are dropped, items in flight drain. Safe
  // to call from any thread, including observers and signal watchers.
  void RequestStop();
  bool StopRequested() const { return stop_requested_.load(); }
  RunState State() const { return state_.load(); }

private:
  bool Enqueue(PipelineItem item);
  void WorkerLoop();
  ItemReport ProcessItem(PipelineItem &item);
  void Finish(ItemReport report);
  void JoinWorkers();

  std::unique_ptr<Provider> provider_;
  std::vector<std::unique_ptr<Processor>> processors_;
  // One per processor; locked around calls of unsafe processors.
  std::vector<std::unique_ptr<std::mutex>> processor_mutexes_;
  ConductOptions options_;
  std::shared_ptr<Logger> logger_;

  std::atomic<RunState> state_{RunState::kPending};
  std::atomic<bool> stop_requested_{false};

  std::vector<std::thread> workers_;
  std::deque<PipelineItem> queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_not_empty_;
  std::condition_variable queue_not_full_;
  bool closed_ = false;

  std::mutex report_mutex_;
  RunReport report_;
  const ItemObserver *observer_ = nullptr;
};

} // namespace metatree
