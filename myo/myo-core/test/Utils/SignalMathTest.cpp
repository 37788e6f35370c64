// Test: signal_math unit tests

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "myo-core/src/Utils/SignalMath.hpp"

namespace myo_core
{
namespace test
{

// ========== percentile ==========

TEST(SignalMath, Percentile_InterpolatesBetweenOrderStatistics)
{
  Eigen::VectorXd values(5);
  values << 4.0, 0.0, 3.0, 1.0, 2.0;

  // rank = 0.1 * 4 = 0.4 between 0 and 1
  EXPECT_NEAR(signal_math::percentile(values, 10.0), 0.4, 1e-12);
  EXPECT_NEAR(signal_math::percentile(values, 50.0), 2.0, 1e-12);
  EXPECT_NEAR(signal_math::percentile(values, 100.0), 4.0, 1e-12);
}

TEST(SignalMath, Percentile_Empty_Throws)
{
  Eigen::VectorXd const values(0);

  EXPECT_THROW((void)signal_math::percentile(values, 10.0), std::invalid_argument);
}

// ========== clippedTrapezoid ==========

TEST(SignalMath, ClippedTrapezoid_IgnoresForceBelowOffset)
{
  Eigen::VectorXd time(3);
  time << 0.0, 1.0, 2.0;
  Eigen::VectorXd force(3);
  force << -1.0, 1.0, -1.0;

  // Clipped samples 0, 1, 0 -> two triangles of area 0.5
  EXPECT_NEAR(signal_math::clippedTrapezoid(time, force, 0.0), 1.0, 1e-12);
}

TEST(SignalMath, ClippedTrapezoid_SingleSample_IsZero)
{
  Eigen::VectorXd time(1);
  time << 0.0;
  Eigen::VectorXd force(1);
  force << 5.0;

  EXPECT_DOUBLE_EQ(signal_math::clippedTrapezoid(time, force, 0.0), 0.0);
}

// ========== mean / coefficientOfVariation ==========

TEST(SignalMath, Mean_Empty_IsAbsent)
{
  EXPECT_FALSE(signal_math::mean({}).has_value());
}

TEST(SignalMath, CoefficientOfVariation_UsesPopulationStd)
{
  // mean 2, population std sqrt(2/3)
  std::vector<double> const values{1.0, 2.0, 3.0};

  auto const cv = signal_math::coefficientOfVariation(values);

  ASSERT_TRUE(cv.has_value());
  EXPECT_NEAR(*cv, std::sqrt(2.0 / 3.0) / 2.0 * 100.0, 1e-10);
}

TEST(SignalMath, CoefficientOfVariation_ZeroMean_IsAbsent)
{
  std::vector<double> const values{-1.0, 1.0};

  EXPECT_FALSE(signal_math::coefficientOfVariation(values).has_value());
}

TEST(SignalMath, CoefficientOfVariation_IdenticalValues_IsZero)
{
  std::vector<double> const values{0.2, 0.2, 0.2, 0.2};

  auto const cv = signal_math::coefficientOfVariation(values);

  ASSERT_TRUE(cv.has_value());
  EXPECT_NEAR(*cv, 0.0, 1e-12);
}

// ========== interpolateCrossing ==========

TEST(SignalMath, InterpolateCrossing_Linear)
{
  EXPECT_NEAR(signal_math::interpolateCrossing(1.0, 0.0, 2.0, 1.0, 0.25), 1.25, 1e-12);
  EXPECT_NEAR(signal_math::interpolateCrossing(1.0, 1.0, 2.0, 0.0, 0.25), 1.75, 1e-12);
}

}  // namespace test
}  // namespace myo_core
