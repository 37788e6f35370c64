// Ticket: 0004_boundary_resolution

#ifndef MYO_CORE_DATA_TYPES_CONTRACTION_HPP
#define MYO_CORE_DATA_TYPES_CONTRACTION_HPP

#include <cstddef>
#include <optional>

namespace myo_core
{

/// A metric that may be undefined (e.g. a period with fewer than two peaks)
using Metric = std::optional<double>;

/**
 * @brief One sample of a trace, addressed within an analysis window
 */
struct SamplePoint
{
  std::size_t index{0};  // Window-local sample index
  double time{0.0};      // [s]
  double force{0.0};     // [mN]
};

/**
 * @brief One detected contraction
 *
 * Created by PeakDetector + BoundaryResolver, enriched in place by
 * KineticsCalculator, then read by MetricAggregator. Indices are local to
 * the window the contraction was detected in.
 *
 * Invariants: start.time <= peak.time <= end.time, duration > 0,
 * amplitude >= the detection minHeight.
 *
 * @ticket 0004_boundary_resolution
 */
struct Contraction
{
  SamplePoint peak;
  SamplePoint start;
  SamplePoint end;

  double amplitude{0.0};   // peak.force - baseline [mN]
  double prominence{0.0};  // Local prominence [mN]

  // Boundary clamped to the window edge (no threshold crossing found)
  bool startTruncated{false};
  bool endTruncated{false};

  // Boundary stopped at the trough shared with a neighbouring contraction
  bool startAtTrough{false};
  bool endAtTrough{false};

  // ===== Kinetics (KineticsCalculator) =====
  double duration{0.0};         // end - start [s]
  double riseTime{0.0};         // peak - start [s]
  double relaxationTime{0.0};   // end - peak [s]
  Metric riseFallRatio;         // riseTime / relaxationTime
  double maxRiseRate{0.0};      // Max dF/dt on the rising edge [mN/s]
  double maxDeclineRate{0.0};   // Min dF/dt on the falling edge [mN/s]
  double integral{0.0};         // Clipped force-time integral [mN*s]
  Metric halfMaxWidth;          // Width at 50% amplitude [s]
  Metric riseTime10to90;        // 10% -> 90% rise [s]
  Metric riseRate10to90;        // 0.8 * amplitude / riseTime10to90 [mN/s]
  Metric relaxTime90to10;       // 90% -> 10% relaxation [s]
  Metric relaxRate90to10;       // 0.8 * amplitude / relaxTime90to10 [mN/s]

  /// True if either boundary was clamped to the window edge
  [[nodiscard]] bool edgeTruncated() const
  {
    return startTruncated || endTruncated;
  }
};

}  // namespace myo_core

#endif  // MYO_CORE_DATA_TYPES_CONTRACTION_HPP
