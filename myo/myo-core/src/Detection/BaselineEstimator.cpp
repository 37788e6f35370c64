// Ticket: 0002_baseline_estimation

#include "myo-core/src/Detection/BaselineEstimator.hpp"

#include "myo-core/src/AnalysisErrors.hpp"
#include "myo-core/src/Utils/SignalMath.hpp"

namespace myo_core
{

double BaselineEstimator::estimate(const TraceView& view)
{
  if (view.size() < kMinimumSamples)
  {
    throw InsufficientDataError{"Baseline window too short",
                                view.size(),
                                kMinimumSamples};
  }

  return signal_math::percentile(view.forces(), kPercentile);
}

}  // namespace myo_core
