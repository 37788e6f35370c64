// Ticket: 0003_peak_detection

#ifndef MYO_CORE_ANALYSIS_CONFIG_HPP
#define MYO_CORE_ANALYSIS_CONFIG_HPP

#include <cstddef>
#include <string>

namespace myo_core
{

/**
 * @brief Detection and aggregation parameters for one analysis run
 *
 * All parameters apply uniformly to every recording so that results remain
 * comparable across conditions. Time-valued parameters are expressed in
 * seconds and converted to samples at the sampling interval of the trace
 * being analysed.
 *
 * Recommended minHeight values by tissue:
 *   0.03 mN  very sensitive (neonatal/weak contractions)
 *   0.05 mN  default (drug-treated tissue)
 *   0.08 mN  strong adult baseline contractions
 *   0.10 mN  noisy data
 *
 * @ticket 0003_peak_detection
 */
struct AnalysisConfig
{
  double minHeight{0.05};        // Minimum peak height above baseline [mN]
  double minProminence{0.05};    // Minimum local prominence [mN]
  double minDistance{1.0};       // Minimum peak spacing [s]
  double minWidth{0.3};          // Minimum width at half prominence [s]
  double analysisWindow{150.0};  // Seconds analysed from recording start [s]
  double binDuration{10.0};      // Temporal bin width [s]
  double boundaryFraction{0.10}; // Start/end crossing, fraction of amplitude
  double amplitudeQualityThreshold{0.03};  // Low-amplitude flag level [mN]
  std::size_t minReliableCount{5};         // Below this, low-count flag

  // Skip edge-truncated contractions when averaging per-contraction kinetics
  bool excludeEdgeTruncatedKinetics{false};

  /**
   * @brief Check parameter ranges
   * @throws std::invalid_argument naming the first offending parameter
   */
  void validate() const;

  /**
   * @brief Minimum peak spacing in whole samples (at least 1)
   * @param samplingInterval Sample spacing [s]
   */
  [[nodiscard]] std::size_t distanceInSamples(double samplingInterval) const;

  /**
   * @brief Minimum peak width in (fractional) samples
   * @param samplingInterval Sample spacing [s]
   */
  [[nodiscard]] double widthInSamples(double samplingInterval) const;

  /**
   * @brief Prominence threshold applied by PeakDetector
   *
   * min(minProminence, minHeight): the prominence requirement never exceeds
   * the height floor, so lowering minHeight alone lowers detection
   * sensitivity for isolated pulses on a flat baseline.
   */
  [[nodiscard]] double effectiveMinProminence() const;

  /// One-line parameter summary for logs
  [[nodiscard]] std::string describe() const;
};

}  // namespace myo_core

#endif  // MYO_CORE_ANALYSIS_CONFIG_HPP
