// Ticket: 0006_metric_aggregation

#ifndef MYO_CORE_DATA_TYPES_METRIC_SET_HPP
#define MYO_CORE_DATA_TYPES_METRIC_SET_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "myo-core/src/DataTypes/Contraction.hpp"

namespace myo_core
{

/**
 * @brief Advisory quality flags
 *
 * Surfaced for manual review. A raised flag never alters or suppresses a
 * computed value.
 */
struct QualityFlags
{
  bool lowAmplitude{false};      // Mean amplitude below the quality threshold
  bool lowCount{false};          // Fewer contractions than minReliableCount
  bool edgeTruncated{false};     // At least one boundary clamped to an edge
  bool insufficientData{false};  // Window too short to analyse (bins only)

  [[nodiscard]] bool any() const
  {
    return lowAmplitude || lowCount || edgeTruncated || insufficientData;
  }
};

using FieldMap = std::vector<std::pair<std::string, Metric>>;

/**
 * @brief Metrics for one analysis window
 *
 * Shared shape of the recording-level and bin-level results. Optional
 * members are absent when undefined for the window (no contractions, fewer
 * than two contractions for periods, zero mean for a CV, ...). Consumers
 * averaging across windows must skip absent values rather than read them
 * as zero.
 *
 * @ticket 0006_metric_aggregation
 */
struct MetricSet
{
  std::size_t count{0};
  double windowDuration{0.0};  // Effective window duration [s]
  double frequencyCpm{0.0};    // Contractions per minute

  Metric baselineTone;     // 10th percentile force [mN]
  Metric meanAmplitude;    // [mN]
  Metric amplitudeCv;      // Population CV [%]
  Metric meanPeriod;       // Mean peak-to-peak interval [s]
  Metric periodCv;         // Population CV [%]

  // Per-contraction kinetics means
  Metric meanDuration;          // [s]
  Metric meanRiseTime;          // Onset to peak [s]
  Metric meanRelaxationTime;    // Peak to offset [s]
  Metric meanRiseFallRatio;
  Metric meanMaxRiseRate;       // [mN/s]
  Metric meanMaxDeclineRate;    // [mN/s], negative
  Metric meanHalfMaxWidth;      // [s]
  Metric meanRiseTime10to90;    // [s]
  Metric meanRiseRate10to90;    // [mN/s]
  Metric meanRelaxTime90to10;   // [s]
  Metric meanRelaxRate90to10;   // [mN/s]

  // Force output
  double totalIntegral{0.0};   // Sum of contraction integrals [mN*s]
  double traceIntegral{0.0};   // Whole-window clipped integral [mN*s]
  Metric forcePerContraction;  // [mN*s]
  double forcePerMinute{0.0};  // [mN*s/min]

  // Duty cycle and tone
  double dutyCyclePct{0.0};
  double totalContractionTime{0.0};   // [s]
  double totalQuiescentTime{0.0};     // [s]
  Metric meanInterContractionInterval;  // [s]
  std::size_t incompleteRelaxationCount{0};
  Metric incompleteRelaxationPct;
  Metric meanQuiescentTone;    // [mN]
  Metric meanTonicForce;       // [mN]
  Metric phasicTonicRatio;

  // Composite indices
  Metric amplitudeFrequencyProduct;  // [mN*cpm]
  Metric contractionWorkIndex;       // [mN*s*cpm]

  std::size_t edgeTruncatedCount{0};
  QualityFlags flags;

  /**
   * @brief Flat, ordered (name, value) view of every numeric field
   *
   * Names are stable column identifiers for the persistence layer; count
   * fields are reported as doubles.
   */
  [[nodiscard]] FieldMap toFieldMap() const;

  /**
   * @brief Human-readable flag summary, empty when no flag is raised
   * @param amplitudeQualityThreshold Threshold quoted in the low-amplitude text
   */
  [[nodiscard]] std::string flagSummary(double amplitudeQualityThreshold) const;
};

/**
 * @brief Metrics for one fixed-width time bin
 */
struct BinMetrics
{
  std::size_t binIndex{0};  // Zero-based position in the window
  double startTime{0.0};    // [s]
  double endTime{0.0};      // [s], exclusive
  MetricSet metrics;

  [[nodiscard]] double duration() const { return endTime - startTime; }

  /// Bin identification fields followed by MetricSet::toFieldMap()
  [[nodiscard]] FieldMap toFieldMap() const;
};

}  // namespace myo_core

#endif  // MYO_CORE_DATA_TYPES_METRIC_SET_HPP
