// Ticket: 0003_peak_detection

#ifndef MYO_CORE_DETECTION_PEAK_DETECTOR_HPP
#define MYO_CORE_DETECTION_PEAK_DETECTOR_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"

namespace myo_core
{

/**
 * @brief Peak accepted by PeakDetector, with the shape data that admitted it
 *
 * All indices are local to the analysed window. Interpolated positions
 * (leftIp, rightIp) are fractional sample indices.
 */
struct PeakCandidate
{
  std::size_t index{0};
  double height{0.0};      // Force above baseline [mN]
  double prominence{0.0};  // [mN]
  std::size_t leftBase{0};
  std::size_t rightBase{0};
  double widthSamples{0.0};  // Width at half prominence [samples]
  double leftIp{0.0};
  double rightIp{0.0};
};

/**
 * @brief Finds contraction peaks in a window of a force trace
 *
 * A peak is a local maximum (plateaus resolve to their middle sample; the
 * first and last sample of the window are never peaks) that satisfies all
 * four criteria of AnalysisConfig:
 *
 * 1. height above baseline >= minHeight
 * 2. separation from every other accepted peak >= minDistance; of two
 *    conflicting peaks the taller is kept, equal heights keep the earlier one
 * 3. prominence >= AnalysisConfig::effectiveMinProminence(); prominence is
 *    measured against the higher of the two minima reached before the signal
 *    exceeds the peak on either side
 * 4. width at half prominence >= minWidth (the primary noise filter: noise
 *    spikes are narrow, contractions are wide)
 *
 * Filters are applied in that order. Detection is deterministic: identical
 * input and parameters always produce the identical peak list.
 *
 * @ticket 0003_peak_detection
 */
class PeakDetector
{
public:
  explicit PeakDetector(const AnalysisConfig& config);

  /**
   * @brief Detect peaks in a window
   *
   * @param view Window to search
   * @param baseline Baseline of the window [mN]
   * @return Accepted peaks in ascending sample order; empty for windows of
   *         fewer than three samples
   */
  [[nodiscard]] std::vector<PeakCandidate> detect(const TraceView& view,
                                                  double baseline) const;

private:
  // Indices of strict local maxima, plateau midpoints included
  static std::vector<std::size_t> findLocalMaxima(const Eigen::VectorXd& x);

  // Keep the taller of any two peaks closer than distance samples
  static std::vector<std::size_t> selectByDistance(
    const std::vector<std::size_t>& peaks,
    const Eigen::VectorXd& x,
    std::size_t distance);

  static void computeProminence(const Eigen::VectorXd& x,
                                PeakCandidate& candidate);

  static void computeWidth(const Eigen::VectorXd& x,
                           PeakCandidate& candidate,
                           double relativeHeight);

  AnalysisConfig config_;
};

}  // namespace myo_core

#endif  // MYO_CORE_DETECTION_PEAK_DETECTOR_HPP
