// Ticket: 0004_boundary_resolution

#include "myo-core/src/Detection/BoundaryResolver.hpp"

#include <stdexcept>

namespace myo_core
{

namespace
{

SamplePoint sampleAt(const TraceView& view, std::size_t index)
{
  return SamplePoint{index, view.time(index), view.force(index)};
}

}  // namespace

BoundaryResolver::BoundaryResolver(const AnalysisConfig& config)
  : boundaryFraction_{config.boundaryFraction}
{
  config.validate();
}

std::vector<Contraction> BoundaryResolver::resolve(
  const TraceView& view,
  double baseline,
  const std::vector<PeakCandidate>& peaks) const
{
  std::vector<Contraction> contractions;
  contractions.reserve(peaks.size());

  for (std::size_t i = 0; i < peaks.size(); ++i)
  {
    std::optional<std::size_t> previous;
    std::optional<std::size_t> next;
    if (i > 0)
    {
      previous = peaks[i - 1].index;
    }
    if (i + 1 < peaks.size())
    {
      next = peaks[i + 1].index;
    }

    contractions.push_back(resolveOne(view, baseline, peaks[i], previous, next));
  }

  return contractions;
}

Contraction BoundaryResolver::resolveOne(const TraceView& view,
                                         double baseline,
                                         const PeakCandidate& peak,
                                         std::optional<std::size_t> previousPeak,
                                         std::optional<std::size_t> nextPeak) const
{
  if (peak.index >= view.size())
  {
    throw std::invalid_argument("BoundaryResolver: peak index outside window");
  }

  Contraction contraction{};
  contraction.peak = sampleAt(view, peak.index);
  contraction.amplitude = contraction.peak.force - baseline;
  contraction.prominence = peak.prominence;

  double const threshold = baseline + boundaryFraction_ * contraction.amplitude;

  // ===== Start: backward scan =====
  std::size_t lowerLimit = 0;
  bool const limitedByPrevious =
    previousPeak && *previousPeak + 1 < peak.index;
  if (limitedByPrevious)
  {
    lowerLimit = troughBetween(view, *previousPeak, peak.index);
  }

  std::size_t start = peak.index;
  bool startFound = false;
  while (start > lowerLimit)
  {
    --start;
    if (view.force(start) <= threshold)
    {
      startFound = true;
      break;
    }
  }
  if (!startFound)
  {
    start = lowerLimit;
    contraction.startAtTrough = limitedByPrevious;
    contraction.startTruncated = !limitedByPrevious;
  }

  // ===== End: forward scan =====
  std::size_t upperLimit = view.size() - 1;
  bool const limitedByNext = nextPeak && peak.index + 1 < *nextPeak;
  if (limitedByNext)
  {
    upperLimit = troughBetween(view, peak.index, *nextPeak);
  }

  std::size_t end = peak.index;
  bool endFound = false;
  while (end < upperLimit)
  {
    ++end;
    if (view.force(end) <= threshold)
    {
      endFound = true;
      break;
    }
  }
  if (!endFound)
  {
    end = upperLimit;
    contraction.endAtTrough = limitedByNext;
    contraction.endTruncated = !limitedByNext;
  }

  contraction.start = sampleAt(view, start);
  contraction.end = sampleAt(view, end);
  return contraction;
}

std::size_t BoundaryResolver::troughBetween(const TraceView& view,
                                            std::size_t left,
                                            std::size_t right)
{
  if (left + 1 >= right || right > view.size())
  {
    throw std::invalid_argument("BoundaryResolver: no samples between peaks");
  }

  std::size_t trough = left + 1;
  for (std::size_t i = left + 2; i < right; ++i)
  {
    if (view.force(i) < view.force(trough))
    {
      trough = i;
    }
  }
  return trough;
}

}  // namespace myo_core
