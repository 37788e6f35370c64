// Ticket: 0003_peak_detection

#include "myo-core/src/AnalysisConfig.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace myo_core
{

namespace
{

void requirePositive(double value, const char* name)
{
  if (!(value > 0.0) || !std::isfinite(value))
  {
    throw std::invalid_argument(
      fmt::format("AnalysisConfig: {} must be positive and finite, got {}",
                  name,
                  value));
  }
}

void requireNonNegative(double value, const char* name)
{
  if (!(value >= 0.0) || !std::isfinite(value))
  {
    throw std::invalid_argument(
      fmt::format("AnalysisConfig: {} must be non-negative and finite, got {}",
                  name,
                  value));
  }
}

}  // namespace

void AnalysisConfig::validate() const
{
  requireNonNegative(minHeight, "minHeight");
  requireNonNegative(minProminence, "minProminence");
  requireNonNegative(minDistance, "minDistance");
  requireNonNegative(minWidth, "minWidth");
  requirePositive(analysisWindow, "analysisWindow");
  requirePositive(binDuration, "binDuration");
  requireNonNegative(amplitudeQualityThreshold, "amplitudeQualityThreshold");

  if (!(boundaryFraction > 0.0 && boundaryFraction < 1.0))
  {
    throw std::invalid_argument(fmt::format(
      "AnalysisConfig: boundaryFraction must be in (0, 1), got {}",
      boundaryFraction));
  }
}

std::size_t AnalysisConfig::distanceInSamples(double samplingInterval) const
{
  if (!(samplingInterval > 0.0))
  {
    return 1;
  }

  // Tolerate representation error so 1.0 s at 4 ms stays 250 samples
  double const samples = minDistance / samplingInterval;
  double const rounded = std::ceil(samples - 1e-9);
  return rounded < 1.0 ? 1 : static_cast<std::size_t>(rounded);
}

double AnalysisConfig::widthInSamples(double samplingInterval) const
{
  if (!(samplingInterval > 0.0))
  {
    return 0.0;
  }
  return minWidth / samplingInterval;
}

double AnalysisConfig::effectiveMinProminence() const
{
  return std::min(minProminence, minHeight);
}

std::string AnalysisConfig::describe() const
{
  return fmt::format(
    "height={} mN, prominence={} mN, distance={:.1f}s, width={:.2f}s, "
    "window={}s, bin={}s",
    minHeight,
    minProminence,
    minDistance,
    minWidth,
    analysisWindow,
    binDuration);
}

}  // namespace myo_core
