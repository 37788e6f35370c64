// Ticket: 0004_boundary_resolution
// Test: BoundaryResolver unit tests

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/Detection/BoundaryResolver.hpp"
#include "myo-core/src/Detection/PeakDetector.hpp"
#include "myo-core/test/Helpers/SyntheticTrace.hpp"

namespace myo_core
{
namespace test
{

static PeakCandidate candidateAt(std::size_t index)
{
  PeakCandidate candidate{};
  candidate.index = index;
  return candidate;
}

// ========== Threshold Crossing ==========

TEST(BoundaryResolver, IsolatedPulse_BoundsAtTenPercentCrossing)
{
  Trace const trace = SyntheticTraceBuilder{10.0}.triangularPulse(5.0, 0.2, 0.5).build();
  BoundaryResolver const resolver{AnalysisConfig{}};

  Contraction const c =
    resolver.resolveOne(trace.view(), 0.0, candidateAt(1250), std::nullopt, std::nullopt);

  // 10% of amplitude is reached 0.45 s either side of the peak
  EXPECT_NEAR(c.start.time, 4.55, 0.004 + 1e-9);
  EXPECT_NEAR(c.end.time, 5.45, 0.004 + 1e-9);
  EXPECT_LE(c.start.force, 0.02);
  EXPECT_LE(c.end.force, 0.02);
  EXPECT_GT(trace.view().force(c.start.index + 1), 0.02);
  EXPECT_GT(trace.view().force(c.end.index - 1), 0.02);

  EXPECT_FALSE(c.startTruncated);
  EXPECT_FALSE(c.endTruncated);
  EXPECT_FALSE(c.startAtTrough);
  EXPECT_FALSE(c.endAtTrough);
}

TEST(BoundaryResolver, Amplitude_IsPeakAboveBaseline)
{
  Trace const trace =
    SyntheticTraceBuilder{10.0, 250.0, 0.1}.triangularPulse(5.0, 0.3, 0.5).build();
  BoundaryResolver const resolver{AnalysisConfig{}};

  Contraction const c =
    resolver.resolveOne(trace.view(), 0.1, candidateAt(1250), std::nullopt, std::nullopt);

  EXPECT_NEAR(c.amplitude, 0.3, 1e-12);
  EXPECT_NEAR(c.peak.force, 0.4, 1e-12);
  EXPECT_NEAR(c.peak.time, 5.0, 1e-12);
}

TEST(BoundaryResolver, LargerFraction_NarrowsBoundaries)
{
  Trace const trace = SyntheticTraceBuilder{10.0}.triangularPulse(5.0, 0.2, 0.5).build();
  AnalysisConfig config{};
  config.boundaryFraction = 0.5;
  BoundaryResolver const resolver{config};

  Contraction const c =
    resolver.resolveOne(trace.view(), 0.0, candidateAt(1250), std::nullopt, std::nullopt);

  EXPECT_NEAR(c.end.time - c.start.time, 0.5, 2 * 0.004 + 1e-9);
}

// ========== Window Edges ==========

TEST(BoundaryResolver, PulseAtWindowStart_StartTruncated)
{
  Trace const trace = SyntheticTraceBuilder{10.0}.triangularPulse(0.2, 0.2, 0.5).build();
  BoundaryResolver const resolver{AnalysisConfig{}};

  Contraction const c =
    resolver.resolveOne(trace.view(), 0.0, candidateAt(50), std::nullopt, std::nullopt);

  EXPECT_TRUE(c.startTruncated);
  EXPECT_FALSE(c.startAtTrough);
  EXPECT_EQ(c.start.index, 0u);
  EXPECT_FALSE(c.endTruncated);
  EXPECT_TRUE(c.edgeTruncated());
}

TEST(BoundaryResolver, PulseAtWindowEnd_EndTruncated)
{
  Trace const trace = SyntheticTraceBuilder{10.0}.triangularPulse(9.8, 0.2, 0.5).build();
  BoundaryResolver const resolver{AnalysisConfig{}};

  Contraction const c =
    resolver.resolveOne(trace.view(), 0.0, candidateAt(2450), std::nullopt, std::nullopt);

  EXPECT_TRUE(c.endTruncated);
  EXPECT_EQ(c.end.index, trace.size() - 1);
  EXPECT_FALSE(c.startTruncated);
  EXPECT_LE(c.start.time, c.peak.time);
  EXPECT_LE(c.peak.time, c.end.time);
}

// ========== Neighbouring Contractions ==========

TEST(BoundaryResolver, FusedPulses_StopAtSharedTrough)
{
  // Overlapping pulses never fall back to 10% between peaks
  Trace const trace = SyntheticTraceBuilder{10.0}
                        .triangularPulse(2.0, 0.2, 0.8)
                        .triangularPulse(3.0, 0.2, 0.8)
                        .build();
  BoundaryResolver const resolver{AnalysisConfig{}};
  std::vector<PeakCandidate> const peaks{candidateAt(500), candidateAt(750)};

  auto const contractions = resolver.resolve(trace.view(), 0.0, peaks);

  ASSERT_EQ(contractions.size(), 2u);
  EXPECT_TRUE(contractions[0].endAtTrough);
  EXPECT_FALSE(contractions[0].endTruncated);
  EXPECT_TRUE(contractions[1].startAtTrough);
  EXPECT_FALSE(contractions[1].startTruncated);
  EXPECT_EQ(contractions[0].end.index, contractions[1].start.index);
  EXPECT_GT(contractions[0].end.index, 500u);
  EXPECT_LT(contractions[1].start.index, 750u);

  // Outer boundaries still resolve at the threshold
  EXPECT_FALSE(contractions[0].startAtTrough);
  EXPECT_FALSE(contractions[1].endAtTrough);
}

TEST(BoundaryResolver, SeparatedPulses_DoNotOverlap)
{
  Trace const trace = fivePulseTrace();
  BoundaryResolver const resolver{AnalysisConfig{}};
  std::vector<PeakCandidate> const peaks{candidateAt(250),
                                         candidateAt(750),
                                         candidateAt(1250),
                                         candidateAt(1750),
                                         candidateAt(2250)};

  auto const contractions = resolver.resolve(trace.view(), 0.0, peaks);

  ASSERT_EQ(contractions.size(), 5u);
  for (std::size_t i = 0; i < contractions.size(); ++i)
  {
    EXPECT_LT(contractions[i].start.time, contractions[i].peak.time);
    EXPECT_LT(contractions[i].peak.time, contractions[i].end.time);
    EXPECT_GT(contractions[i].amplitude, 0.0);
    EXPECT_FALSE(contractions[i].edgeTruncated());
    if (i > 0)
    {
      EXPECT_LT(contractions[i - 1].end.index, contractions[i].start.index);
    }
  }
}

// ========== Errors ==========

TEST(BoundaryResolver, PeakOutsideWindow_Throws)
{
  Trace const trace = SyntheticTraceBuilder{1.0}.build();
  BoundaryResolver const resolver{AnalysisConfig{}};

  EXPECT_THROW((void)resolver.resolveOne(
                 trace.view(), 0.0, candidateAt(1000), std::nullopt, std::nullopt),
               std::invalid_argument);
}

TEST(BoundaryResolver, TroughBetween_AdjacentIndices_Throws)
{
  Trace const trace = SyntheticTraceBuilder{1.0}.build();

  EXPECT_THROW((void)BoundaryResolver::troughBetween(trace.view(), 10, 11),
               std::invalid_argument);
}

TEST(BoundaryResolver, TroughBetween_ReturnsEarliestMinimum)
{
  std::vector<double> const time{0.0, 1.0, 2.0, 3.0, 4.0, 5.0};
  std::vector<double> const force{1.0, 0.2, 0.5, 0.2, 0.9, 1.0};
  Trace const trace{time, force};

  EXPECT_EQ(BoundaryResolver::troughBetween(trace.view(), 0, 5), 1u);
  EXPECT_EQ(BoundaryResolver::troughBetween(trace.view(), 2, 5), 3u);
}

}  // namespace test
}  // namespace myo_core
