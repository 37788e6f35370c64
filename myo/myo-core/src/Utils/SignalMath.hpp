#ifndef MYO_CORE_UTILS_SIGNAL_MATH_HPP
#define MYO_CORE_UTILS_SIGNAL_MATH_HPP

#include <Eigen/Dense>
#include <vector>

#include "myo-core/src/DataTypes/Contraction.hpp"

namespace myo_core::signal_math
{

/**
 * @brief Percentile with linear interpolation between order statistics
 *
 * Rank = p/100 * (n - 1); matches the conventional "linear" percentile
 * definition. Requires a non-empty input.
 *
 * @param values Samples (copied, not modified)
 * @param percent Percentile in [0, 100]
 */
double percentile(const Eigen::Ref<const Eigen::VectorXd>& values,
                  double percent);

/**
 * @brief Trapezoidal integral of max(force - offset, 0) over time
 *
 * Integrates the clipped samples, so the result is never negative.
 */
double clippedTrapezoid(const Eigen::Ref<const Eigen::VectorXd>& time,
                        const Eigen::Ref<const Eigen::VectorXd>& force,
                        double offset);

/// Arithmetic mean; absent for an empty input
Metric mean(const std::vector<double>& values);

/**
 * @brief Population coefficient of variation, std / mean * 100 (ddof = 0)
 *
 * Absent for an empty input or a zero mean.
 */
Metric coefficientOfVariation(const std::vector<double>& values);

/// Linear interpolation of the time at which force crosses level between samples
double interpolateCrossing(double t0, double f0, double t1, double f1, double level);

}  // namespace myo_core::signal_math

#endif  // MYO_CORE_UTILS_SIGNAL_MATH_HPP
