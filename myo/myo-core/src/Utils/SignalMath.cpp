#include "myo-core/src/Utils/SignalMath.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace myo_core::signal_math
{

double percentile(const Eigen::Ref<const Eigen::VectorXd>& values,
                  double percent)
{
  if (values.size() == 0)
  {
    throw std::invalid_argument("percentile of an empty sample set");
  }

  Eigen::VectorXd sorted = values;
  std::sort(sorted.data(), sorted.data() + sorted.size());

  double const rank =
    std::clamp(percent, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
  auto const lower = static_cast<Eigen::Index>(std::floor(rank));
  auto const upper = std::min<Eigen::Index>(lower + 1, sorted.size() - 1);
  double const fraction = rank - static_cast<double>(lower);

  return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

double clippedTrapezoid(const Eigen::Ref<const Eigen::VectorXd>& time,
                        const Eigen::Ref<const Eigen::VectorXd>& force,
                        double offset)
{
  if (time.size() < 2)
  {
    return 0.0;
  }

  Eigen::ArrayXd const clipped = (force.array() - offset).max(0.0);
  Eigen::Index const n = time.size();
  Eigen::ArrayXd const dt = time.tail(n - 1).array() - time.head(n - 1).array();

  return (0.5 * dt * (clipped.head(n - 1) + clipped.tail(n - 1))).sum();
}

Metric mean(const std::vector<double>& values)
{
  if (values.empty())
  {
    return std::nullopt;
  }
  Eigen::Map<const Eigen::VectorXd> const v{values.data(),
                                            static_cast<Eigen::Index>(values.size())};
  return v.mean();
}

Metric coefficientOfVariation(const std::vector<double>& values)
{
  Metric const mu = mean(values);
  if (!mu || *mu == 0.0)
  {
    return std::nullopt;
  }

  Eigen::Map<const Eigen::VectorXd> const v{values.data(),
                                            static_cast<Eigen::Index>(values.size())};
  double const variance = (v.array() - *mu).square().mean();
  return std::sqrt(variance) / *mu * 100.0;
}

double interpolateCrossing(double t0, double f0, double t1, double f1, double level)
{
  if (f1 == f0)
  {
    return t0;
  }
  return t0 + (level - f0) / (f1 - f0) * (t1 - t0);
}

}  // namespace myo_core::signal_math
