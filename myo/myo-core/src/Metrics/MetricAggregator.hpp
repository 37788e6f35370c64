// Ticket: 0006_metric_aggregation

#ifndef MYO_CORE_METRICS_METRIC_AGGREGATOR_HPP
#define MYO_CORE_METRICS_METRIC_AGGREGATOR_HPP

#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/Contraction.hpp"
#include "myo-core/src/DataTypes/MetricSet.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"

namespace myo_core
{

/**
 * @brief Reduces the contractions of one window to a MetricSet
 *
 * Conventions:
 * - Rates use the effective window duration as denominator.
 * - CVs are population CVs (ddof = 0): std / mean * 100.
 * - Periods are consecutive peak-to-peak intervals; fewer than two
 *   contractions leave every period metric absent.
 * - A consecutive pair relaxes incompletely when the trough between the
 *   peaks stays above baseline + boundaryFraction * amplitude of the first.
 * - Quality flags are advisory and never change a value.
 *
 * @ticket 0006_metric_aggregation
 */
class MetricAggregator
{
public:
  explicit MetricAggregator(const AnalysisConfig& config);

  /**
   * @brief Aggregate one window
   *
   * @param view The analysed window
   * @param baseline Baseline of the window [mN]
   * @param contractions Contractions with kinetics computed, in peak order
   * @return Metrics for the window
   */
  [[nodiscard]] MetricSet aggregate(
    const TraceView& view,
    double baseline,
    const std::vector<Contraction>& contractions) const;

private:
  void aggregateAmplitudeAndPeriod(const std::vector<Contraction>& contractions,
                                   MetricSet& metrics) const;
  void aggregateKinetics(const std::vector<Contraction>& contractions,
                         MetricSet& metrics) const;
  void aggregateTone(const TraceView& view,
                     double baseline,
                     const std::vector<Contraction>& contractions,
                     MetricSet& metrics) const;
  void raiseFlags(MetricSet& metrics) const;

  AnalysisConfig config_;
};

}  // namespace myo_core

#endif  // MYO_CORE_METRICS_METRIC_AGGREGATOR_HPP
