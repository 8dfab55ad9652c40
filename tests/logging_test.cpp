#include <metatree/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  metatree::StructuredLogger logger(stream, {metatree::LogLevel::kInfo});

  logger.Log(metatree::LogLevel::kDebug, "traverse.dataset", {});
  logger.Log(metatree::LogLevel::kInfo, "conduct.start", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("traverse.dataset"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("conduct.start"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  metatree::StructuredLogger logger(stream, {metatree::LogLevel::kDebug});

  logger.Log(metatree::LogLevel::kDebug, "index.seal",
             {{"dataset_id", "abc"}, {"generation", "3"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"dataset_id\": \"abc\""));
  EXPECT_NE(std::string::npos, output.find("\"generation\": \"3\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"index.seal\""));
}

TEST(LoggingTest, EscapesQuotesAndNewlines) {
  std::stringstream stream;
  metatree::StructuredLogger logger(stream, {metatree::LogLevel::kDebug});

  logger.Log(metatree::LogLevel::kWarn, "conduct.item",
             {{"message", "say \"hi\"\nbye"}});

  EXPECT_NE(std::string::npos, stream.str().find("say \\\"hi\\\"\\nbye"));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = metatree::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<metatree::NullLogger>(provided));

  auto custom = std::make_shared<metatree::StructuredLogger>(
      std::cout, metatree::LoggingConfig{});
  EXPECT_EQ(custom, metatree::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLogLevelNames) {
  EXPECT_EQ(metatree::ParseLogLevel(" Debug "), metatree::LogLevel::kDebug);
  EXPECT_EQ(metatree::ParseLogLevel("warning"), metatree::LogLevel::kWarn);
  EXPECT_EQ(metatree::LogLevelName(metatree::LogLevel::kError), "error");
  EXPECT_THROW(metatree::ParseLogLevel("loud"), std::invalid_argument);
}

TEST(LoggingTest, KeepsLinesWholeUnderConcurrentWriters) {
  std::stringstream stream;
  metatree::StructuredLogger logger(stream, {metatree::LogLevel::kInfo});

  std::vector<std::thread> writers;
  for (int i = 0; i < 4; ++i) {
    writers.emplace_back([&logger] {
      for (int j = 0; j < 50; ++j) {
        logger.Log(metatree::LogLevel::kInfo, "worker.tick",
                   {{"n", std::to_string(j)}});
      }
    });
  }
  for (auto &writer : writers) {
    writer.join();
  }

  std::string line;
  int lines = 0;
  while (std::getline(stream, line)) {
    ++lines;
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(std::string::npos, line.find("worker.tick"));
  }
  EXPECT_EQ(lines, 200);
}

} // namespace
