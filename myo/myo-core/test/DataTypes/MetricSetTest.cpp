// Ticket: 0006_metric_aggregation
// Test: MetricSet and BinMetrics unit tests

#include <gtest/gtest.h>

#include <string>

#include "myo-core/src/DataTypes/MetricSet.hpp"

namespace myo_core
{
namespace test
{

TEST(MetricSet, FieldMap_StableColumnNames)
{
  MetricSet metrics{};
  metrics.count = 3;
  metrics.meanAmplitude = 0.25;

  auto const fields = metrics.toFieldMap();

  ASSERT_FALSE(fields.empty());
  EXPECT_EQ(fields.front().first, "num_contractions");
  EXPECT_EQ(fields.front().second, 3.0);
  EXPECT_EQ(fields[4].first, "mean_amplitude_mN");
  EXPECT_EQ(fields[4].second, 0.25);
  EXPECT_EQ(fields.back().first, "flag_insufficient_data");
}

TEST(MetricSet, FieldMap_AbsentStaysAbsent)
{
  MetricSet const metrics{};

  for (const auto& [name, value] : metrics.toFieldMap())
  {
    if (name == "mean_period_sec" || name == "baseline_mN" ||
        name == "phasic_tonic_ratio")
    {
      EXPECT_FALSE(value.has_value()) << name;
    }
    if (name == "frequency_cpm" || name == "n_edge_truncated")
    {
      ASSERT_TRUE(value.has_value()) << name;
      EXPECT_EQ(*value, 0.0);
    }
  }
}

TEST(MetricSet, FlagSummary_EmptyWhenUnflagged)
{
  MetricSet const metrics{};

  EXPECT_FALSE(metrics.flags.any());
  EXPECT_TRUE(metrics.flagSummary(0.03).empty());
}

TEST(MetricSet, FlagSummary_JoinsRaisedFlags)
{
  MetricSet metrics{};
  metrics.count = 2;
  metrics.meanAmplitude = 0.02;
  metrics.edgeTruncatedCount = 1;
  metrics.flags.lowAmplitude = true;
  metrics.flags.lowCount = true;
  metrics.flags.edgeTruncated = true;

  EXPECT_EQ(metrics.flagSummary(0.03),
            "LOW_AMP (0.0200 mN < 0.03 mN) - Review validation plot; "
            "LOW_COUNT (n=2); EDGE_TRUNCATED (n=1)");
}

TEST(BinMetrics, FieldMap_LeadsWithOneBasedBinIdentity)
{
  BinMetrics bin{};
  bin.binIndex = 2;
  bin.startTime = 20.0;
  bin.endTime = 30.0;

  auto const fields = bin.toFieldMap();

  ASSERT_GE(fields.size(), 4u);
  EXPECT_EQ(fields[0].first, "bin");
  EXPECT_EQ(fields[0].second, 3.0);
  EXPECT_EQ(fields[1].first, "time_start_sec");
  EXPECT_EQ(fields[1].second, 20.0);
  EXPECT_EQ(fields[2].first, "time_end_sec");
  EXPECT_EQ(fields[3].first, "num_contractions");
  EXPECT_DOUBLE_EQ(bin.duration(), 10.0);
  EXPECT_EQ(fields.size(), MetricSet{}.toFieldMap().size() + 3);
}

}  // namespace test
}  // namespace myo_core
