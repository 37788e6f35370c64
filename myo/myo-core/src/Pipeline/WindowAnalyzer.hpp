// Ticket: 0007_window_pipeline

#ifndef MYO_CORE_PIPELINE_WINDOW_ANALYZER_HPP
#define MYO_CORE_PIPELINE_WINDOW_ANALYZER_HPP

#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/Contraction.hpp"
#include "myo-core/src/DataTypes/MetricSet.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"
#include "myo-core/src/Detection/BoundaryResolver.hpp"
#include "myo-core/src/Detection/PeakDetector.hpp"
#include "myo-core/src/Metrics/MetricAggregator.hpp"

namespace myo_core
{

/**
 * @brief Everything derived from one window
 *
 * Contractions are owned by the window that produced them; a bin's
 * contractions come from its own detection pass and are never shared with
 * the full-window result.
 */
struct WindowAnalysis
{
  double baseline{0.0};
  std::vector<Contraction> contractions;
  MetricSet metrics;
};

/**
 * @brief Runs the ordered chain on one window
 *
 * baseline -> peak detection -> boundary resolution -> kinetics ->
 * aggregation. Stateless between calls; a single instance may be shared
 * by concurrent callers.
 *
 * @ticket 0007_window_pipeline
 */
class WindowAnalyzer
{
public:
  /**
   * @throws std::invalid_argument if the configuration is invalid
   */
  explicit WindowAnalyzer(const AnalysisConfig& config);

  /**
   * @brief Analyse one window
   * @throws InsufficientDataError if the window holds fewer than two samples
   */
  [[nodiscard]] WindowAnalysis analyze(const TraceView& view) const;

  [[nodiscard]] const AnalysisConfig& config() const { return config_; }

private:
  AnalysisConfig config_;
  PeakDetector detector_;
  BoundaryResolver resolver_;
  MetricAggregator aggregator_;
};

}  // namespace myo_core

#endif  // MYO_CORE_PIPELINE_WINDOW_ANALYZER_HPP
