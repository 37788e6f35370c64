// Ticket: 0005_contraction_kinetics

#include "myo-core/src/Kinetics/KineticsCalculator.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>

#include "myo-core/src/Utils/SignalMath.hpp"

namespace myo_core
{

namespace
{

constexpr double kHalfMaximum = 0.5;
constexpr double kLowLevel = 0.1;
constexpr double kHighLevel = 0.9;
constexpr double kExcursion = kHighLevel - kLowLevel;

double slope(const TraceView& view, std::size_t i)
{
  return (view.force(i + 1) - view.force(i)) / (view.time(i + 1) - view.time(i));
}

}  // namespace

void KineticsCalculator::compute(const TraceView& view,
                                 double baseline,
                                 Contraction& contraction)
{
  contraction.duration = contraction.end.time - contraction.start.time;
  contraction.riseTime = contraction.peak.time - contraction.start.time;
  contraction.relaxationTime = contraction.end.time - contraction.peak.time;

  contraction.riseFallRatio = std::nullopt;
  if (contraction.relaxationTime > 0.0)
  {
    contraction.riseFallRatio =
      contraction.riseTime / contraction.relaxationTime;
  }

  std::size_t const first = contraction.start.index;
  std::size_t const length = contraction.end.index - first + 1;
  contraction.integral = signal_math::clippedTrapezoid(
    view.times().segment(static_cast<Eigen::Index>(first),
                         static_cast<Eigen::Index>(length)),
    view.forces().segment(static_cast<Eigen::Index>(first),
                          static_cast<Eigen::Index>(length)),
    baseline);

  computeDerivativeExtremes(view, contraction);
  computeHalfMaxWidth(view, baseline, contraction);
  computeTenNinetyKinetics(view, baseline, contraction);
}

void KineticsCalculator::computeAll(const TraceView& view,
                                    double baseline,
                                    std::vector<Contraction>& contractions)
{
  for (auto& contraction : contractions)
  {
    compute(view, baseline, contraction);
  }
}

void KineticsCalculator::computeDerivativeExtremes(const TraceView& view,
                                                   Contraction& contraction)
{
  std::size_t const start = contraction.start.index;
  std::size_t const peak = contraction.peak.index;
  std::size_t const end = contraction.end.index;

  double maxRise = 0.0;
  if (start < peak)
  {
    maxRise = -std::numeric_limits<double>::infinity();
    for (std::size_t i = start; i < peak; ++i)
    {
      maxRise = std::max(maxRise, slope(view, i));
    }
  }

  double maxDecline = 0.0;
  if (peak < end)
  {
    maxDecline = std::numeric_limits<double>::infinity();
    for (std::size_t i = peak; i < end; ++i)
    {
      maxDecline = std::min(maxDecline, slope(view, i));
    }
  }

  contraction.maxRiseRate = maxRise;
  contraction.maxDeclineRate = maxDecline;
}

void KineticsCalculator::computeHalfMaxWidth(const TraceView& view,
                                             double baseline,
                                             Contraction& contraction)
{
  contraction.halfMaxWidth = std::nullopt;
  if (!(contraction.amplitude > 0.0))
  {
    return;
  }

  double const level = baseline + kHalfMaximum * contraction.amplitude;
  std::size_t const start = contraction.start.index;
  std::size_t const peak = contraction.peak.index;
  std::size_t const end = contraction.end.index;

  std::size_t left = peak;
  while (left > start && view.force(left) > level)
  {
    --left;
  }
  std::size_t right = peak;
  while (right < end && view.force(right) > level)
  {
    ++right;
  }

  if (view.force(left) > level || view.force(right) > level)
  {
    return;
  }

  double const leftTime = signal_math::interpolateCrossing(view.time(left),
                                                           view.force(left),
                                                           view.time(left + 1),
                                                           view.force(left + 1),
                                                           level);
  double const rightTime = signal_math::interpolateCrossing(view.time(right - 1),
                                                            view.force(right - 1),
                                                            view.time(right),
                                                            view.force(right),
                                                            level);
  contraction.halfMaxWidth = rightTime - leftTime;
}

void KineticsCalculator::computeTenNinetyKinetics(const TraceView& view,
                                                  double baseline,
                                                  Contraction& contraction)
{
  contraction.riseTime10to90 = std::nullopt;
  contraction.riseRate10to90 = std::nullopt;
  contraction.relaxTime90to10 = std::nullopt;
  contraction.relaxRate90to10 = std::nullopt;

  double const amplitude = contraction.amplitude;
  if (!(amplitude > 0.0))
  {
    return;
  }

  double const low = baseline + kLowLevel * amplitude;
  double const high = baseline + kHighLevel * amplitude;
  std::size_t const start = contraction.start.index;
  std::size_t const peak = contraction.peak.index;
  std::size_t const end = contraction.end.index;

  // Rising edge: first samples at or above 10% and 90%. A rise that already
  // starts above 10% (truncated at the window edge) has no 10% crossing.
  bool const riseCrossesLow = view.force(start) <= low;
  std::optional<std::size_t> onset;
  std::optional<std::size_t> nearPeak;
  for (std::size_t i = start; riseCrossesLow && i <= peak; ++i)
  {
    double const f = view.force(i);
    if (!onset && f >= low)
    {
      onset = i;
    }
    if (f >= high)
    {
      nearPeak = i;
      break;
    }
  }
  if (onset && nearPeak && *onset < *nearPeak)
  {
    double const rise = view.time(*nearPeak) - view.time(*onset);
    contraction.riseTime10to90 = rise;
    contraction.riseRate10to90 = kExcursion * amplitude / rise;
  }

  // Falling edge: first sample at or below 90%, then at or below 10%
  std::optional<std::size_t> fallStart;
  std::optional<std::size_t> offset;
  for (std::size_t i = peak; i <= end; ++i)
  {
    double const f = view.force(i);
    if (!fallStart)
    {
      if (f <= high)
      {
        fallStart = i;
      }
      continue;
    }
    if (f <= low)
    {
      offset = i;
      break;
    }
  }
  if (fallStart && offset)
  {
    double const relax = view.time(*offset) - view.time(*fallStart);
    contraction.relaxTime90to10 = relax;
    contraction.relaxRate90to10 = kExcursion * amplitude / relax;
  }
}

}  // namespace myo_core
