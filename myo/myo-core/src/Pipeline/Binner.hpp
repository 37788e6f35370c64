// Ticket: 0008_temporal_binning

#ifndef MYO_CORE_PIPELINE_BINNER_HPP
#define MYO_CORE_PIPELINE_BINNER_HPP

#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/MetricSet.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"
#include "myo-core/src/Pipeline/WindowAnalyzer.hpp"

namespace myo_core
{

/**
 * @brief Partitions an analysis window into fixed-width bins and analyses
 *        each bin independently
 *
 * Bin k spans [start + k * binDuration, start + (k + 1) * binDuration),
 * clipped to the window; the final bin may be shorter and keeps its true
 * duration in rate denominators. Bins cover the window without gaps or
 * overlap.
 *
 * Every bin recomputes its own baseline and re-detects its own peaks, so a
 * contraction straddling a bin edge may be counted differently than in the
 * full-window result. This is intended: bins describe how activity evolves
 * over time and do not subdivide the full-window contraction list.
 *
 * A bin with fewer than two samples yields a zero-count BinMetrics with an
 * absent baseline and the insufficientData flag raised.
 *
 * @ticket 0008_temporal_binning
 */
class Binner
{
public:
  explicit Binner(const AnalysisConfig& config);

  /**
   * @brief Analyse every bin of a window, in time order
   * @param window The analysis window
   * @return One entry per bin; empty for a zero-duration window
   */
  [[nodiscard]] std::vector<BinMetrics> bin(const TraceView& window) const;

  /**
   * @brief Number of bins a window of the given duration produces
   * @param windowDuration Effective window duration [s]
   */
  [[nodiscard]] std::size_t binCount(double windowDuration) const;

private:
  BinMetrics analyzeBin(const TraceView& window, std::size_t binIndex) const;

  double binDuration_;
  WindowAnalyzer analyzer_;
};

}  // namespace myo_core

#endif  // MYO_CORE_PIPELINE_BINNER_HPP
