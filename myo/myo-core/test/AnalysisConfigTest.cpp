// Ticket: 0003_peak_detection
// Test: AnalysisConfig unit tests

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "myo-core/src/AnalysisConfig.hpp"

namespace myo_core
{
namespace test
{

TEST(AnalysisConfig, Defaults_AreValid)
{
  AnalysisConfig const config{};

  EXPECT_DOUBLE_EQ(config.minHeight, 0.05);
  EXPECT_DOUBLE_EQ(config.minProminence, 0.05);
  EXPECT_DOUBLE_EQ(config.minDistance, 1.0);
  EXPECT_DOUBLE_EQ(config.minWidth, 0.3);
  EXPECT_DOUBLE_EQ(config.analysisWindow, 150.0);
  EXPECT_DOUBLE_EQ(config.binDuration, 10.0);
  EXPECT_DOUBLE_EQ(config.boundaryFraction, 0.10);
  EXPECT_DOUBLE_EQ(config.amplitudeQualityThreshold, 0.03);
  EXPECT_EQ(config.minReliableCount, 5u);
  EXPECT_FALSE(config.excludeEdgeTruncatedKinetics);
  EXPECT_NO_THROW(config.validate());
}

TEST(AnalysisConfig, Validate_RejectsOutOfRangeParameters)
{
  AnalysisConfig config{};
  config.binDuration = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = AnalysisConfig{};
  config.analysisWindow = -1.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = AnalysisConfig{};
  config.minHeight = -0.01;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = AnalysisConfig{};
  config.minWidth = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = AnalysisConfig{};
  config.boundaryFraction = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.boundaryFraction = 1.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(AnalysisConfig, Validate_MessageNamesParameter)
{
  AnalysisConfig config{};
  config.binDuration = 0.0;

  try
  {
    config.validate();
    FAIL() << "Expected std::invalid_argument";
  }
  catch (const std::invalid_argument& e)
  {
    EXPECT_NE(std::string{e.what()}.find("binDuration"), std::string::npos);
  }
}

TEST(AnalysisConfig, DistanceInSamples_ConvertsAtSamplingInterval)
{
  AnalysisConfig config{};

  EXPECT_EQ(config.distanceInSamples(0.004), 250u);
  EXPECT_EQ(config.distanceInSamples(0.003), 334u);

  config.minDistance = 0.0;
  EXPECT_EQ(config.distanceInSamples(0.004), 1u);
}

TEST(AnalysisConfig, WidthInSamples_ConvertsAtSamplingInterval)
{
  AnalysisConfig const config{};

  EXPECT_NEAR(config.widthInSamples(0.004), 75.0, 1e-9);
  EXPECT_DOUBLE_EQ(config.widthInSamples(0.0), 0.0);
}

TEST(AnalysisConfig, EffectiveMinProminence_NeverExceedsHeight)
{
  AnalysisConfig config{};
  EXPECT_DOUBLE_EQ(config.effectiveMinProminence(), 0.05);

  config.minHeight = 0.01;
  EXPECT_DOUBLE_EQ(config.effectiveMinProminence(), 0.01);

  config.minHeight = 0.2;
  EXPECT_DOUBLE_EQ(config.effectiveMinProminence(), 0.05);
}

TEST(AnalysisConfig, Describe_ListsParameters)
{
  std::string const text = AnalysisConfig{}.describe();

  EXPECT_NE(text.find("height=0.05 mN"), std::string::npos);
  EXPECT_NE(text.find("distance=1.0s"), std::string::npos);
  EXPECT_NE(text.find("bin=10s"), std::string::npos);
}

}  // namespace test
}  // namespace myo_core
