// Ticket: 0004_boundary_resolution

#ifndef MYO_CORE_DETECTION_BOUNDARY_RESOLVER_HPP
#define MYO_CORE_DETECTION_BOUNDARY_RESOLVER_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/Contraction.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"
#include "myo-core/src/Detection/PeakDetector.hpp"

namespace myo_core
{

/**
 * @brief Resolves the start and end sample of each detected contraction
 *
 * With threshold = baseline + boundaryFraction * amplitude:
 * - start: first sample at or below threshold scanning backward from the peak
 * - end: first sample at or below threshold scanning forward from the peak
 *
 * Scans never cross into a neighbouring contraction: the backward scan stops
 * at the trough shared with the previous peak and the forward scan at the
 * trough shared with the next peak (startAtTrough / endAtTrough). A scan that
 * reaches the window edge without a crossing clamps the boundary to the edge
 * sample and marks it truncated (startTruncated / endTruncated). Truncated
 * contractions are kept; their duration and relaxation time end at the
 * window, not at a true relaxation.
 *
 * @ticket 0004_boundary_resolution
 */
class BoundaryResolver
{
public:
  explicit BoundaryResolver(const AnalysisConfig& config);

  /**
   * @brief Bound every peak of a window
   *
   * @param view Window the peaks were detected in
   * @param baseline Baseline of the window [mN]
   * @param peaks Accepted peaks in ascending sample order
   * @return One Contraction per peak, in the same order
   */
  [[nodiscard]] std::vector<Contraction> resolve(
    const TraceView& view,
    double baseline,
    const std::vector<PeakCandidate>& peaks) const;

  /**
   * @brief Bound a single peak
   *
   * @param previousPeak Index of the preceding accepted peak, if any
   * @param nextPeak Index of the following accepted peak, if any
   */
  [[nodiscard]] Contraction resolveOne(const TraceView& view,
                                       double baseline,
                                       const PeakCandidate& peak,
                                       std::optional<std::size_t> previousPeak,
                                       std::optional<std::size_t> nextPeak) const;

  /**
   * @brief Earliest minimum strictly between two peak indices
   *
   * @pre left + 1 < right
   */
  [[nodiscard]] static std::size_t troughBetween(const TraceView& view,
                                                 std::size_t left,
                                                 std::size_t right);

private:
  double boundaryFraction_;
};

}  // namespace myo_core

#endif  // MYO_CORE_DETECTION_BOUNDARY_RESOLVER_HPP
