// Ticket: 0003_peak_detection

#include "myo-core/src/Detection/PeakDetector.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>

#include <spdlog/spdlog.h>

namespace myo_core
{

namespace
{

constexpr double kHalfProminence = 0.5;

}  // namespace

PeakDetector::PeakDetector(const AnalysisConfig& config) : config_{config}
{
  config_.validate();
}

std::vector<PeakCandidate> PeakDetector::detect(const TraceView& view,
                                                double baseline) const
{
  std::vector<PeakCandidate> accepted;
  if (view.size() < 3)
  {
    return accepted;
  }

  // Work on baseline-relative force so heights compare directly to minHeight
  Eigen::VectorXd const x = (view.forces().array() - baseline).matrix();

  std::vector<std::size_t> peaks = findLocalMaxima(x);
  std::size_t const localMaxima = peaks.size();

  std::erase_if(peaks,
                [&x, this](std::size_t p)
                { return x[static_cast<Eigen::Index>(p)] < config_.minHeight; });
  std::size_t const aboveHeight = peaks.size();

  std::size_t const distance =
    config_.distanceInSamples(view.samplingInterval());
  if (distance > 1)
  {
    peaks = selectByDistance(peaks, x, distance);
  }

  double const minWidthSamples = config_.widthInSamples(view.samplingInterval());
  double const minProminence = config_.effectiveMinProminence();

  for (std::size_t const p : peaks)
  {
    PeakCandidate candidate{};
    candidate.index = p;
    candidate.height = x[static_cast<Eigen::Index>(p)];

    computeProminence(x, candidate);
    if (candidate.prominence < minProminence)
    {
      continue;
    }

    computeWidth(x, candidate, kHalfProminence);
    if (candidate.widthSamples < minWidthSamples)
    {
      continue;
    }

    accepted.push_back(candidate);
  }

  spdlog::debug(
    "PeakDetector: {} local maxima, {} above height, {} after distance, "
    "{} accepted in [{:.3f}, {:.3f}) s",
    localMaxima,
    aboveHeight,
    peaks.size(),
    accepted.size(),
    view.startTime(),
    view.endTime());

  return accepted;
}

std::vector<std::size_t> PeakDetector::findLocalMaxima(const Eigen::VectorXd& x)
{
  std::vector<std::size_t> maxima;
  Eigen::Index const last = x.size() - 1;

  Eigen::Index i = 1;
  while (i < last)
  {
    if (x[i - 1] < x[i])
    {
      // Walk across a flat plateau, if any
      Eigen::Index ahead = i + 1;
      while (ahead < last && x[ahead] == x[i])
      {
        ++ahead;
      }

      if (x[ahead] < x[i])
      {
        Eigen::Index const left = i;
        Eigen::Index const right = ahead - 1;
        maxima.push_back(static_cast<std::size_t>((left + right) / 2));
        i = ahead;
      }
    }
    ++i;
  }

  return maxima;
}

std::vector<std::size_t> PeakDetector::selectByDistance(
  const std::vector<std::size_t>& peaks,
  const Eigen::VectorXd& x,
  std::size_t distance)
{
  std::size_t const count = peaks.size();

  // Visit peaks tallest first; equal heights visit the earlier peak first
  std::vector<std::size_t> order(count);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(),
                   order.end(),
                   [&](std::size_t a, std::size_t b)
                   {
                     return x[static_cast<Eigen::Index>(peaks[a])] >
                            x[static_cast<Eigen::Index>(peaks[b])];
                   });

  std::vector<bool> keep(count, true);
  for (std::size_t const current : order)
  {
    if (!keep[current])
    {
      continue;
    }

    for (std::size_t j = current; j > 0 && peaks[current] - peaks[j - 1] < distance;
         --j)
    {
      keep[j - 1] = false;
    }

    for (std::size_t k = current + 1;
         k < count && peaks[k] - peaks[current] < distance;
         ++k)
    {
      keep[k] = false;
    }
  }

  std::vector<std::size_t> selected;
  selected.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    if (keep[i])
    {
      selected.push_back(peaks[i]);
    }
  }
  return selected;
}

void PeakDetector::computeProminence(const Eigen::VectorXd& x,
                                     PeakCandidate& candidate)
{
  auto const peak = static_cast<Eigen::Index>(candidate.index);
  double const peakValue = x[peak];

  // Left: lowest point before the signal rises above the peak
  Eigen::Index leftBase = peak;
  double leftMin = peakValue;
  for (Eigen::Index i = peak; i >= 0 && x[i] <= peakValue; --i)
  {
    if (x[i] < leftMin)
    {
      leftMin = x[i];
      leftBase = i;
    }
  }

  // Right: same search forward
  Eigen::Index rightBase = peak;
  double rightMin = peakValue;
  for (Eigen::Index i = peak; i < x.size() && x[i] <= peakValue; ++i)
  {
    if (x[i] < rightMin)
    {
      rightMin = x[i];
      rightBase = i;
    }
  }

  candidate.leftBase = static_cast<std::size_t>(leftBase);
  candidate.rightBase = static_cast<std::size_t>(rightBase);
  candidate.prominence = peakValue - std::max(leftMin, rightMin);
}

void PeakDetector::computeWidth(const Eigen::VectorXd& x,
                                PeakCandidate& candidate,
                                double relativeHeight)
{
  auto const peak = static_cast<Eigen::Index>(candidate.index);
  auto const leftBase = static_cast<Eigen::Index>(candidate.leftBase);
  auto const rightBase = static_cast<Eigen::Index>(candidate.rightBase);
  double const level = x[peak] - candidate.prominence * relativeHeight;

  Eigen::Index i = peak;
  while (leftBase < i && level < x[i])
  {
    --i;
  }
  double leftIp = static_cast<double>(i);
  if (x[i] < level)
  {
    leftIp += (level - x[i]) / (x[i + 1] - x[i]);
  }

  i = peak;
  while (i < rightBase && level < x[i])
  {
    ++i;
  }
  double rightIp = static_cast<double>(i);
  if (x[i] < level)
  {
    rightIp -= (level - x[i]) / (x[i - 1] - x[i]);
  }

  candidate.leftIp = leftIp;
  candidate.rightIp = rightIp;
  candidate.widthSamples = rightIp - leftIp;
}

}  // namespace myo_core
