// Ticket: 0002_baseline_estimation

#ifndef MYO_CORE_DETECTION_BASELINE_ESTIMATOR_HPP
#define MYO_CORE_DETECTION_BASELINE_ESTIMATOR_HPP

#include <cstddef>

#include "myo-core/src/DataTypes/Trace.hpp"

namespace myo_core
{

/**
 * @brief Resting-tone reference level of a force window
 *
 * The baseline is the 10th percentile of all force samples in the window.
 * Transient contraction peaks pull the mean upward and a single artifact
 * pulls the minimum downward; the low percentile is stable against both.
 *
 * @ticket 0002_baseline_estimation
 */
class BaselineEstimator
{
public:
  static constexpr double kPercentile = 10.0;
  static constexpr std::size_t kMinimumSamples = 2;

  /**
   * @brief Compute the baseline of a window
   *
   * @param view Window to evaluate
   * @return 10th percentile force [mN]
   * @throws InsufficientDataError if the window holds fewer than
   *         kMinimumSamples samples
   */
  [[nodiscard]] static double estimate(const TraceView& view);
};

}  // namespace myo_core

#endif  // MYO_CORE_DETECTION_BASELINE_ESTIMATOR_HPP
