#include <metatree/conductor.h>
#include <metatree/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support/fake_stages.h"

namespace metatree {
namespace {

using ::testing::HasSubstr;
using ::testing::SizeIs;

std::vector<std::unique_ptr<Processor>>
Chain(std::unique_ptr<Processor> processor) {
  std::vector<std::unique_ptr<Processor>> processors;
  processors.push_back(std::move(processor));
  return processors;
}

TEST(ConductorTest, RunsEveryItemThroughTheChain) {
  auto first = std::make_unique<test::ScriptedProcessor>(
      "first", [](PipelineItem &item) {
        item.records.emplace_back();
        return test::Ok();
      });
  auto second = std::make_unique<test::ScriptedProcessor>(
      "second", [](PipelineItem &item) {
        return test::Ok("saw " + std::to_string(item.records.size()));
      });
  std::vector<std::unique_ptr<Processor>> processors;
  processors.push_back(std::move(first));
  processors.push_back(std::move(second));

  Conductor conductor(std::make_unique<test::CountingProvider>(20),
                      std::move(processors), ConductOptions{4, 0});
  const auto report = conductor.Run();

  EXPECT_EQ(report.state, RunState::kCompleted);
  EXPECT_EQ(conductor.State(), RunState::kCompleted);
  EXPECT_EQ(report.summary.ok, 20u);
  EXPECT_THAT(report.items, SizeIs(20));
  for (const auto &item : report.items) {
    EXPECT_EQ(item.stage, "second");
    EXPECT_EQ(item.message, "saw 1");
    EXPECT_THAT(item.records, SizeIs(1));
  }
}

TEST(ConductorTest, ObservedRunsKeepOnlyTheSummary) {
  Conductor conductor(std::make_unique<test::CountingProvider>(20),
                      Chain(std::make_unique<test::ScriptedProcessor>(
                          "only", [](PipelineItem &item) {
                            item.records.emplace_back();
                            return test::Ok();
                          })),
                      ConductOptions{4, 0});
  std::set<std::string> observed;
  std::size_t records = 0;
  const auto report =
      conductor.Run([&observed, &records](const ItemReport &item) {
        observed.insert(item.item);
        records += item.records.size();
      });

  EXPECT_EQ(report.state, RunState::kCompleted);
  EXPECT_EQ(report.summary.ok, 20u);
  EXPECT_TRUE(report.items.empty());
  EXPECT_THAT(observed, SizeIs(20));
  EXPECT_EQ(records, 20u);
}

TEST(ConductorTest, ItemFailuresDoNotStopTheRun) {
  auto failing = std::make_unique<test::ScriptedProcessor>(
      "picky", [](PipelineItem &item) -> StageResult {
        if (item.work.path == "item-3") {
          throw std::runtime_error("cannot read item-3");
        }
        if (item.work.path == "item-5") {
          return StageResult{ItemOutcome::kImpossible, "no content"};
        }
        return test::Ok();
      });
  auto after = std::make_unique<test::ScriptedProcessor>(
      "after", [](PipelineItem &) { return test::Ok(); });
  auto *after_raw = after.get();
  std::vector<std::unique_ptr<Processor>> processors;
  processors.push_back(std::move(failing));
  processors.push_back(std::move(after));

  Conductor conductor(std::make_unique<test::CountingProvider>(8),
                      std::move(processors), ConductOptions{3, 0});
  const auto report = conductor.Run();

  EXPECT_EQ(report.state, RunState::kCompleted);
  EXPECT_EQ(report.summary.ok, 6u);
  EXPECT_EQ(report.summary.error, 1u);
  EXPECT_EQ(report.summary.impossible, 1u);
  EXPECT_EQ(after_raw->Calls(), 6);
  for (const auto &item : report.items) {
    if (item.item == "item-3") {
      EXPECT_EQ(item.outcome, ItemOutcome::kError);
      EXPECT_EQ(item.stage, "picky");
      EXPECT_THAT(item.message, HasSubstr("cannot read"));
    }
  }
}

TEST(ConductorTest, SerializesProcessorsThatAreNotConcurrencySafe) {
  auto unsafe = std::make_unique<test::ScriptedProcessor>(
      "unsafe", test::Sleeping(std::chrono::milliseconds(5)), false);
  auto *unsafe_raw = unsafe.get();

  Conductor conductor(std::make_unique<test::CountingProvider>(24),
                      Chain(std::move(unsafe)), ConductOptions{6, 0});
  const auto report = conductor.Run();

  EXPECT_EQ(report.summary.ok, 24u);
  EXPECT_EQ(unsafe_raw->MaxActive(), 1);
}

TEST(ConductorTest, RunsSafeProcessorsInParallel) {
  auto safe = std::make_unique<test::ScriptedProcessor>(
      "safe", test::Sleeping(std::chrono::milliseconds(20)));
  auto *safe_raw = safe.get();

  Conductor conductor(std::make_unique<test::CountingProvider>(16),
                      Chain(std::move(safe)), ConductOptions{4, 0});
  conductor.Run();

  EXPECT_GT(safe_raw->MaxActive(), 1);
  EXPECT_LE(safe_raw->MaxActive(), 4);
}

TEST(ConductorTest, ProviderWaitsWhileTheQueueIsFull) {
  std::mutex mutex;
  std::condition_variable released;
  bool open = false;
  auto gate = std::make_unique<test::ScriptedProcessor>(
      "gate", [&](PipelineItem &) {
        std::unique_lock<std::mutex> lock(mutex);
        released.wait(lock, [&] { return open; });
        return test::Ok();
      });
  auto provider = std::make_unique<test::CountingProvider>(50);
  auto *provider_raw = provider.get();

  Conductor conductor(std::move(provider), Chain(std::move(gate)),
                      ConductOptions{1, 2});
  RunReport report;
  std::thread runner([&] { report = conductor.Run(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  // One item in the worker, two queued and one waiting to be queued.
  EXPECT_LE(provider_raw->Produced(), 4u);
  {
    std::lock_guard<std::mutex> lock(mutex);
    open = true;
  }
  released.notify_all();
  runner.join();

  EXPECT_EQ(report.summary.ok, 50u);
}

TEST(ConductorTest, StopRequestCancelsTheRun) {
  auto slow = std::make_unique<test::ScriptedProcessor>(
      "slow", test::Sleeping(std::chrono::milliseconds(10)));
  Conductor conductor(std::make_unique<test::CountingProvider>(1000),
                      Chain(std::move(slow)), ConductOptions{2, 2});

  const auto report = conductor.Run([&conductor](const ItemReport &) {
    conductor.RequestStop();
  });

  EXPECT_EQ(report.state, RunState::kFailed);
  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.failure_reason, "Run was stopped");
  EXPECT_TRUE(conductor.StopRequested());
  EXPECT_GE(report.summary.Total(), 1u);
  EXPECT_LT(report.summary.Total(), 1000u);
}

TEST(ConductorTest, ProviderFailureFailsTheRunAfterDraining) {
  Conductor conductor(
      std::make_unique<test::CountingProvider>(10, 4),
      Chain(std::make_unique<test::ScriptedProcessor>(
          "noop", [](PipelineItem &) { return test::Ok(); })),
      ConductOptions{2, 0});
  const auto report = conductor.Run();

  EXPECT_EQ(report.state, RunState::kFailed);
  EXPECT_FALSE(report.cancelled);
  EXPECT_THAT(report.failure_reason, HasSubstr("Provider counting failed"));
  EXPECT_THAT(report.failure_reason, HasSubstr("source went away"));
  EXPECT_EQ(report.summary.ok, 4u);
}

TEST(ConductorTest, ObserverExceptionsAreContained) {
  Conductor conductor(
      std::make_unique<test::CountingProvider>(3),
      Chain(std::make_unique<test::ScriptedProcessor>(
          "noop", [](PipelineItem &) { return test::Ok(); })),
      ConductOptions{1, 0}, std::make_shared<NullLogger>());
  const auto report = conductor.Run(
      [](const ItemReport &) { throw std::runtime_error("output closed"); });

  EXPECT_EQ(report.state, RunState::kCompleted);
  EXPECT_EQ(report.summary.ok, 3u);
}

TEST(ConductorTest, RunsOnlyOnce) {
  Conductor conductor(
      std::make_unique<test::CountingProvider>(1),
      Chain(std::make_unique<test::ScriptedProcessor>(
          "noop", [](PipelineItem &) { return test::Ok(); })),
      ConductOptions{});
  conductor.Run();
  EXPECT_THROW(conductor.Run(), std::logic_error);
}

TEST(ConductorTest, RejectsInvalidConstruction) {
  const auto noop = [] {
    return Chain(std::make_unique<test::ScriptedProcessor>(
        "noop", [](PipelineItem &) { return test::Ok(); }));
  };
  EXPECT_THROW(Conductor(nullptr, noop(), ConductOptions{}),
               ConfigurationError);
  EXPECT_THROW(Conductor(std::make_unique<test::CountingProvider>(1), noop(),
                         ConductOptions{0, 0}),
               ConfigurationError);

  std::vector<std::unique_ptr<Processor>> with_null;
  with_null.push_back(nullptr);
  EXPECT_THROW(Conductor(std::make_unique<test::CountingProvider>(1),
                         std::move(with_null), ConductOptions{}),
               ConfigurationError);
}

TEST(RunSummaryTest, CountsAndSerializes) {
  RunReport report;
  report.state = RunState::kCompleted;
  report.summary.Add(ItemOutcome::kOk);
  report.summary.Add(ItemOutcome::kNotNeeded);
  report.summary.Add(ItemOutcome::kError);

  EXPECT_EQ(report.summary.Total(), 3u);
  EXPECT_EQ(report.summary.Count(ItemOutcome::kNotNeeded), 1u);

  const auto json = SummaryJson(report);
  EXPECT_EQ(json.at("state"), ToString(RunState::kCompleted));
  EXPECT_FALSE(json.contains("items"));
}

} // namespace
} // namespace metatree
