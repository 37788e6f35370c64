// Ticket: 0001_trace_windowing
// Test helper: synthetic force traces

#ifndef MYO_CORE_TEST_HELPERS_SYNTHETIC_TRACE_HPP
#define MYO_CORE_TEST_HELPERS_SYNTHETIC_TRACE_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

#include "myo-core/src/DataTypes/Trace.hpp"

namespace myo_core
{
namespace test
{

/**
 * @brief Builds uniformly sampled force traces from simple shapes
 *
 * Sample i sits at startTime + i / sampleRate. Shapes add on top of the
 * constant level given at construction.
 *
 * Triangular pulses are specified by their full width at half maximum: a
 * pulse of width w rises linearly over w and falls linearly over w, so its
 * base spans 2 * w and the half-height crossings are exactly w apart.
 */
class SyntheticTraceBuilder
{
public:
  SyntheticTraceBuilder(double duration,
                        double sampleRate = 250.0,
                        double level = 0.0,
                        double startTime = 0.0)
    : sampleRate_{sampleRate}, startTime_{startTime}
  {
    auto const count =
      static_cast<Eigen::Index>(std::llround(duration * sampleRate));
    time_.resize(count);
    for (Eigen::Index i = 0; i < count; ++i)
    {
      time_[i] = startTime + static_cast<double>(i) / sampleRate;
    }
    force_ = Eigen::VectorXd::Constant(count, level);
  }

  SyntheticTraceBuilder& triangularPulse(double peakTime,
                                         double amplitude,
                                         double halfMaxWidth)
  {
    for (Eigen::Index i = 0; i < time_.size(); ++i)
    {
      double const shape = 1.0 - std::abs(time_[i] - peakTime) / halfMaxWidth;
      if (shape > 0.0)
      {
        force_[i] += amplitude * shape;
      }
    }
    return *this;
  }

  /// Evenly spaced identical pulses, the first peaking at firstPeak
  SyntheticTraceBuilder& pulseTrain(double firstPeak,
                                    double spacing,
                                    std::size_t count,
                                    double amplitude,
                                    double halfMaxWidth)
  {
    for (std::size_t k = 0; k < count; ++k)
    {
      triangularPulse(firstPeak + static_cast<double>(k) * spacing,
                      amplitude,
                      halfMaxWidth);
    }
    return *this;
  }

  /// Single-sample spike at the sample nearest to t
  SyntheticTraceBuilder& spike(double t, double amplitude)
  {
    force_[indexAt(t)] += amplitude;
    return *this;
  }

  /// Constant offset over [t0, t1)
  SyntheticTraceBuilder& step(double t0, double t1, double offset)
  {
    for (Eigen::Index i = 0; i < time_.size(); ++i)
    {
      if (time_[i] >= t0 && time_[i] < t1)
      {
        force_[i] += offset;
      }
    }
    return *this;
  }

  /// Deterministic Gaussian noise
  SyntheticTraceBuilder& noise(double sigma, std::uint32_t seed = 42)
  {
    std::mt19937 generator{seed};
    std::normal_distribution<double> distribution{0.0, sigma};
    for (Eigen::Index i = 0; i < force_.size(); ++i)
    {
      force_[i] += distribution(generator);
    }
    return *this;
  }

  [[nodiscard]] Eigen::Index indexAt(double t) const
  {
    auto const index =
      static_cast<Eigen::Index>(std::llround((t - startTime_) * sampleRate_));
    return std::clamp<Eigen::Index>(index, 0, time_.size() - 1);
  }

  [[nodiscard]] Trace build() const { return Trace{time_, force_}; }

private:
  double sampleRate_;
  double startTime_;
  Eigen::VectorXd time_;
  Eigen::VectorXd force_;
};

/// Five 0.2 mN pulses, 0.5 s wide at half maximum, peaking at 1, 3, 5, 7, 9 s
inline Trace fivePulseTrace()
{
  return SyntheticTraceBuilder{10.0}.pulseTrain(1.0, 2.0, 5, 0.2, 0.5).build();
}

}  // namespace test
}  // namespace myo_core

#endif  // MYO_CORE_TEST_HELPERS_SYNTHETIC_TRACE_HPP
