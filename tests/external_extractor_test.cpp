#include <metatree/dataset_repository.h>
#include <metatree/errors.h>
#include <metatree/external_extractor.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>

#include "test_support/sample_records.h"
#include "test_support/temporary_dataset.h"

namespace metatree {
namespace {

using ::testing::HasSubstr;

constexpr const char kProtocolScript[] = R"sh(#!/bin/sh
case "$1" in
  --get-uuid) echo "44444444-4444-4444-8444-444444444444" ;;
  --get-version) echo "2.1" ;;
  --get-data-output-category) echo "IMMEDIATE" ;;
  --extract)
    if [ -n "$4" ]; then
      printf '{"version": "%s", "file": "%s", "cwd": "%s"}\n' "$3" "$5" "$(pwd)"
    else
      printf '{"version": "%s", "cwd": "%s"}\n' "$3" "$(pwd)"
    fi ;;
esac
)sh";

class ExternalExtractorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dataset_ = directory_.InitDataset("dataset", test::kRootId, "v7");
    directory_.AddFile("dataset/data.txt", "payload");
    file_ = dataset_->Enumerate(false).back();
    script_ = WriteScript("protocol.sh", kProtocolScript);
  }

  std::filesystem::path WriteScript(const std::string &name,
                                    const std::string &content) {
    const auto path = directory_.AddFile("bin/" + name, content);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);
    return path;
  }

  ExtractorContext Context(nlohmann::json parameters) const {
    ExtractorContext context;
    context.dataset = dataset_;
    context.file = file_;
    context.parameters = std::move(parameters);
    context.timeout = std::chrono::milliseconds(5000);
    return context;
  }

  test::TemporaryDataset directory_;
  std::shared_ptr<DirectoryRepository> dataset_;
  TreeEntry file_;
  std::filesystem::path script_;
};

TEST(ExternalExtractorConfigTest, ReadsParameters) {
  const auto config = ExternalExtractorConfig::FromParameters(
      {{"command", {"python3", "-m", "tool"}},
       {"arguments", "--fast"},
       {"version", "3"},
       {"data-output-category", "FILE"}});

  EXPECT_EQ(config.command.size(), 3u);
  EXPECT_EQ(config.arguments.front(), "--fast");
  EXPECT_EQ(config.version, "3");
  EXPECT_EQ(config.output_mode, OutputMode::kExternalFile);
  EXPECT_FALSE(config.extractor_id.has_value());
}

TEST(ExternalExtractorConfigTest, RejectsMissingOrMalformedParameters) {
  EXPECT_THROW(ExternalExtractorConfig::FromParameters(nlohmann::json::object()),
               ConfigurationError);
  EXPECT_THROW(ExternalExtractorConfig::FromParameters({{"command", 5}}),
               ConfigurationError);
  EXPECT_THROW(ExternalExtractorConfig::FromParameters(
                   {{"command", "x"}, {"data-output-category", "STREAM"}}),
               ConfigurationError);
}

TEST_F(ExternalExtractorTest, AsksTheProgramForItsIdentity) {
  ExternalExtractor extractor(ExtractorKind::kFile,
                              Context({{"command", {"/bin/sh", script_.string()}}}));

  EXPECT_EQ(extractor.GetId(), "44444444-4444-4444-8444-444444444444");
  EXPECT_EQ(extractor.GetVersion(), "2.1");
}

TEST_F(ExternalExtractorTest, ExtractsFileMetadataFromImmediateOutput) {
  ExternalExtractor extractor(
      ExtractorKind::kFile,
      Context({{"command", {"/bin/sh", script_.string()}},
               {"data-output-category", "IMMEDIATE"}}));

  const auto record =
      ExtractRecord(extractor, "external_file", Context({}), AgentInfo{"a", "b"});

  EXPECT_EQ(record.type, RecordType::kFile);
  EXPECT_EQ(record.path, file_.intra_dataset_path);
  EXPECT_EQ(record.extractor_version, "2.1");
  EXPECT_EQ(record.extracted_metadata.at("version"), "v7");
  EXPECT_EQ(record.extracted_metadata.at("file"), file_.intra_dataset_path);
  EXPECT_EQ(std::filesystem::weakly_canonical(
                record.extracted_metadata.at("cwd").get<std::string>()),
            std::filesystem::weakly_canonical(dataset_->Root()));
}

TEST_F(ExternalExtractorTest, FileOutputIsWrittenToTheSink) {
  ExternalExtractor extractor(
      ExtractorKind::kDataset,
      Context({{"command", {"/bin/sh", script_.string()}},
               {"data-output-category", "FILE"},
               {"version", "9"}}));

  std::ostringstream sink;
  const auto result = extractor.Extract(sink);

  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.immediate_data.has_value());
  EXPECT_EQ(nlohmann::json::parse(sink.str()).at("version"), "v7");
  EXPECT_EQ(result.extractor_version, "9");
}

TEST_F(ExternalExtractorTest, NonZeroExitIsAnExternalFailure) {
  const auto failing =
      WriteScript("failing.sh", "#!/bin/sh\necho broken input >&2\nexit 3\n");
  ExternalExtractor extractor(
      ExtractorKind::kDataset,
      Context({{"command", {"/bin/sh", failing.string()}},
               {"data-output-category", "IMMEDIATE"},
               {"version", "1"}}));

  std::ostringstream sink;
  try {
    extractor.Extract(sink);
    FAIL() << "expected ExternalFailure";
  } catch (const ExternalFailure &error) {
    EXPECT_THAT(error.what(), HasSubstr("status 3"));
    EXPECT_THAT(error.what(), HasSubstr("broken input"));
  }
}

TEST_F(ExternalExtractorTest, OutputThatIsNotJsonIsAnExternalFailure) {
  const auto chatty = WriteScript("chatty.sh", "#!/bin/sh\necho hello\n");
  ExternalExtractor extractor(
      ExtractorKind::kDataset,
      Context({{"command", {"/bin/sh", chatty.string()}},
               {"data-output-category", "IMMEDIATE"},
               {"version", "1"}}));

  std::ostringstream sink;
  EXPECT_THROW(extractor.Extract(sink), ExternalFailure);
}

TEST_F(ExternalExtractorTest, TimeoutEndsTheProgram) {
  const auto slow = WriteScript("slow.sh", "#!/bin/sh\nsleep 30\n");
  auto context = Context({{"command", {"/bin/sh", slow.string()}},
                          {"data-output-category", "IMMEDIATE"},
                          {"version", "1"}});
  context.timeout = std::chrono::milliseconds(200);
  ExternalExtractor extractor(ExtractorKind::kDataset, context);

  const auto started = std::chrono::steady_clock::now();
  std::ostringstream sink;
  EXPECT_THROW(extractor.Extract(sink), ExternalFailure);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(ExternalExtractorTest, StopRequestEndsTheProgram) {
  const auto slow = WriteScript("slow.sh", "#!/bin/sh\nsleep 30\n");
  const std::atomic<bool> stop{true};
  auto context = Context({{"command", {"/bin/sh", slow.string()}},
                          {"data-output-category", "IMMEDIATE"},
                          {"version", "1"}});
  context.stop_requested = &stop;
  ExternalExtractor extractor(ExtractorKind::kDataset, context);

  std::ostringstream sink;
  try {
    extractor.Extract(sink);
    FAIL() << "expected ExternalFailure";
  } catch (const ExternalFailure &error) {
    EXPECT_THAT(error.what(), HasSubstr("stopped"));
  }
}

TEST_F(ExternalExtractorTest, MissingProgramIsAnExternalFailure) {
  ExternalExtractor extractor(
      ExtractorKind::kDataset,
      Context({{"command", "/nonexistent/metatree-extractor"},
               {"data-output-category", "IMMEDIATE"},
               {"version", "1"}}));

  std::ostringstream sink;
  EXPECT_THROW(extractor.Extract(sink), ExternalFailure);
}

TEST_F(ExternalExtractorTest, FileExtractorNeedsAFile) {
  auto context = Context({{"command", "x"}});
  context.file.reset();
  EXPECT_THROW(ExternalExtractor(ExtractorKind::kFile, context),
               ConfigurationError);
}

} // namespace
} // namespace metatree
