// Ticket: 0008_temporal_binning

#include "myo-core/src/Pipeline/Binner.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

#include "myo-core/src/Detection/BaselineEstimator.hpp"

namespace myo_core
{

namespace
{

// Remainders below this fraction of a bin are floating-point residue of the
// window end, not a bin of their own
constexpr double kResidualBinFraction = 1e-6;

}  // namespace

Binner::Binner(const AnalysisConfig& config)
  : binDuration_{config.binDuration}, analyzer_{config}
{
}

std::size_t Binner::binCount(double windowDuration) const
{
  if (!(windowDuration > 0.0))
  {
    return 0;
  }

  auto count = static_cast<std::size_t>(std::floor(windowDuration / binDuration_));
  double const remainder =
    windowDuration - static_cast<double>(count) * binDuration_;
  if (remainder > kResidualBinFraction * binDuration_)
  {
    ++count;
  }
  return count;
}

std::vector<BinMetrics> Binner::bin(const TraceView& window) const
{
  std::size_t const count = binCount(window.duration());

  std::vector<BinMetrics> bins;
  bins.reserve(count);
  for (std::size_t k = 0; k < count; ++k)
  {
    bins.push_back(analyzeBin(window, k));
  }
  return bins;
}

BinMetrics Binner::analyzeBin(const TraceView& window, std::size_t binIndex) const
{
  double const start =
    window.startTime() + static_cast<double>(binIndex) * binDuration_;
  TraceView const view = window.subWindow(start, binDuration_);

  BinMetrics result{};
  result.binIndex = binIndex;
  result.startTime = view.startTime();
  result.endTime = view.endTime();

  if (view.size() < BaselineEstimator::kMinimumSamples)
  {
    spdlog::warn("Bin {} [{:.3f}, {:.3f}) s holds {} samples; reported as "
                 "insufficient data",
                 binIndex + 1,
                 result.startTime,
                 result.endTime,
                 view.size());
    result.metrics.windowDuration = view.duration();
    result.metrics.flags.insufficientData = true;
    result.metrics.flags.lowCount = analyzer_.config().minReliableCount > 0;
    return result;
  }

  result.metrics = analyzer_.analyze(view).metrics;
  return result;
}

}  // namespace myo_core
