// Ticket: 0010_batch_analysis
// Test: BatchAnalyzer unit tests

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/Pipeline/BatchAnalyzer.hpp"
#include "myo-core/test/Helpers/SyntheticTrace.hpp"

namespace myo_core
{
namespace test
{

class BatchAnalyzerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("batch_test", nullSink);
  }

  static NamedTrace regular(const std::string& name, double amplitude = 0.2)
  {
    return NamedTrace{
      name,
      SyntheticTraceBuilder{30.0}.pulseTrain(1.0, 2.0, 15, amplitude, 0.5).build()};
  }

  static NamedTrace flat(const std::string& name)
  {
    return NamedTrace{name, SyntheticTraceBuilder{30.0, 250.0, 0.2}.build()};
  }

  static NamedTrace broken(const std::string& name)
  {
    return NamedTrace{name, Trace{std::vector<double>{0.0}, std::vector<double>{0.1}}};
  }

  std::shared_ptr<spdlog::logger> logger_;
};

// ========== Failure Isolation ==========

TEST_F(BatchAnalyzerTest, FailingRecording_ReportedWithoutAbortingBatch)
{
  BatchAnalyzer const analyzer{AnalysisConfig{}, BatchAnalyzer::Config{2}, logger_};
  std::vector<NamedTrace> const recordings{
    regular("a.txt"), broken("b.txt"), regular("c.txt")};

  auto const batch = analyzer.analyze(recordings);

  ASSERT_EQ(batch.results.size(), 2u);
  EXPECT_EQ(batch.results[0].name, "a.txt");
  EXPECT_EQ(batch.results[1].name, "c.txt");

  ASSERT_EQ(batch.failures.size(), 1u);
  EXPECT_EQ(batch.failures[0].name, "b.txt");
  EXPECT_NE(batch.failures[0].reason.find("too short"), std::string::npos);
  EXPECT_EQ(batch.failedNames(), std::vector<std::string>{"b.txt"});
}

TEST_F(BatchAnalyzerTest, EmptyBatch_EmptyResult)
{
  BatchAnalyzer const analyzer{AnalysisConfig{}, BatchAnalyzer::Config{}, logger_};

  auto const batch = analyzer.analyze({});

  EXPECT_TRUE(batch.results.empty());
  EXPECT_TRUE(batch.failures.empty());
}

// ========== Ordering and Determinism ==========

TEST_F(BatchAnalyzerTest, Results_KeepInputOrder)
{
  BatchAnalyzer const analyzer{AnalysisConfig{}, BatchAnalyzer::Config{4}, logger_};
  std::vector<NamedTrace> recordings;
  for (int i = 0; i < 12; ++i)
  {
    recordings.push_back(regular("r" + std::to_string(i) + ".txt"));
  }

  auto const batch = analyzer.analyze(recordings);

  ASSERT_EQ(batch.results.size(), recordings.size());
  for (std::size_t i = 0; i < recordings.size(); ++i)
  {
    EXPECT_EQ(batch.results[i].name, recordings[i].name);
  }
}

TEST_F(BatchAnalyzerTest, ParallelResults_MatchSerialResults)
{
  std::vector<NamedTrace> const recordings{
    regular("a.txt", 0.2), regular("b.txt", 0.35), flat("c.txt"), regular("d.txt", 0.1)};

  BatchAnalyzer const serial{AnalysisConfig{}, BatchAnalyzer::Config{1}, logger_};
  BatchAnalyzer const parallel{AnalysisConfig{}, BatchAnalyzer::Config{4}, logger_};

  auto const expected = serial.analyze(recordings);
  auto const actual = parallel.analyze(recordings);

  ASSERT_EQ(actual.results.size(), expected.results.size());
  for (std::size_t i = 0; i < expected.results.size(); ++i)
  {
    auto const expectedFields = expected.results[i].metrics().toFieldMap();
    auto const actualFields = actual.results[i].metrics().toFieldMap();
    ASSERT_EQ(actualFields.size(), expectedFields.size());
    for (std::size_t f = 0; f < expectedFields.size(); ++f)
    {
      EXPECT_EQ(actualFields[f].second, expectedFields[f].second)
        << expected.results[i].name << " " << expectedFields[f].first;
    }
    EXPECT_EQ(actual.results[i].bins.size(), expected.results[i].bins.size());
  }
}

// ========== Quality Flags ==========

TEST_F(BatchAnalyzerTest, FlaggedNames_ListsRecordingsNeedingReview)
{
  BatchAnalyzer const analyzer{AnalysisConfig{}, BatchAnalyzer::Config{2}, logger_};
  std::vector<NamedTrace> const recordings{
    regular("good.txt"), flat("quiet.txt"), regular("weak.txt", 0.02)};

  auto const batch = analyzer.analyze(recordings);

  // The weak pulses fall below minHeight, leaving weak.txt with no contractions
  std::vector<std::string> const expected{"quiet.txt", "weak.txt"};
  EXPECT_EQ(batch.flaggedNames(), expected);
}

TEST_F(BatchAnalyzerTest, FailureAndFlags_Logged)
{
  std::ostringstream output;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
  auto logger = std::make_shared<spdlog::logger>("batch_capture", sink);
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::info);

  BatchAnalyzer const analyzer{AnalysisConfig{}, BatchAnalyzer::Config{1}, logger};
  std::vector<NamedTrace> const recordings{broken("b.txt"), flat("quiet.txt")};

  (void)analyzer.analyze(recordings);
  logger->flush();

  std::string const log = output.str();
  EXPECT_NE(log.find("error Failed to analyse 'b.txt'"), std::string::npos);
  EXPECT_NE(log.find("warning Recording 'quiet.txt' flagged for review: LOW_COUNT (n=0)"),
            std::string::npos);
}

// ========== Worker Pool ==========

TEST_F(BatchAnalyzerTest, WorkersFor_ClampedToRecordingCount)
{
  BatchAnalyzer const fixed{AnalysisConfig{}, BatchAnalyzer::Config{8}, logger_};
  EXPECT_EQ(fixed.workersFor(3), 3u);
  EXPECT_EQ(fixed.workersFor(20), 8u);
  EXPECT_EQ(fixed.workersFor(0), 1u);

  BatchAnalyzer const automatic{AnalysisConfig{}, BatchAnalyzer::Config{0}, logger_};
  EXPECT_GE(automatic.workersFor(100), 1u);
  EXPECT_EQ(automatic.workersFor(1), 1u);
}

TEST_F(BatchAnalyzerTest, InvalidConfig_Throws)
{
  AnalysisConfig config{};
  config.boundaryFraction = 1.5;

  EXPECT_THROW((BatchAnalyzer{config, BatchAnalyzer::Config{}, logger_}),
               std::invalid_argument);
}

}  // namespace test
}  // namespace myo_core
