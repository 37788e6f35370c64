// Ticket: 0005_contraction_kinetics

#ifndef MYO_CORE_KINETICS_KINETICS_CALCULATOR_HPP
#define MYO_CORE_KINETICS_KINETICS_CALCULATOR_HPP

#include <vector>

#include "myo-core/src/DataTypes/Contraction.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"

namespace myo_core
{

/**
 * @brief Per-contraction timing, rate and force-output quantities
 *
 * Boundary kinetics (from the resolved start/end samples):
 *   duration        = end - start
 *   riseTime        = peak - start
 *   relaxationTime  = end - peak
 *   riseFallRatio   = riseTime / relaxationTime (absent if relaxationTime is 0)
 *   maxRiseRate     = max forward-difference dF/dt over [start, peak]
 *   maxDeclineRate  = min forward-difference dF/dt over [peak, end]
 *   integral        = trapezoid of max(F - baseline, 0) over [start, end]
 *
 * Independent shape measures, each absent when its levels are not crossed
 * inside the boundaries:
 *   halfMaxWidth    = width at baseline + 0.5 * amplitude, linearly
 *                     interpolated; a cross-check on duration, not a
 *                     substitute for it
 *   riseTime10to90  = first sample >= 10% to first sample >= 90% (rising)
 *   relaxTime90to10 = first sample <= 90% to the next sample <= 10% (falling)
 *   rates           = 0.8 * amplitude / time (the 80% excursion)
 *
 * @ticket 0005_contraction_kinetics
 */
class KineticsCalculator
{
public:
  /**
   * @brief Fill the kinetic fields of a bounded contraction in place
   *
   * @param view Window the contraction was resolved in
   * @param baseline Baseline of the window [mN]
   * @param contraction Contraction with peak/start/end set
   */
  static void compute(const TraceView& view,
                      double baseline,
                      Contraction& contraction);

  /// compute() for every contraction of a window
  static void computeAll(const TraceView& view,
                         double baseline,
                         std::vector<Contraction>& contractions);

private:
  static void computeDerivativeExtremes(const TraceView& view,
                                        Contraction& contraction);
  static void computeHalfMaxWidth(const TraceView& view,
                                  double baseline,
                                  Contraction& contraction);
  static void computeTenNinetyKinetics(const TraceView& view,
                                       double baseline,
                                       Contraction& contraction);
};

}  // namespace myo_core

#endif  // MYO_CORE_KINETICS_KINETICS_CALCULATOR_HPP
