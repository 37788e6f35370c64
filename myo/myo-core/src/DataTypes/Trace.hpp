// Ticket: 0001_trace_windowing

#ifndef MYO_CORE_DATA_TYPES_TRACE_HPP
#define MYO_CORE_DATA_TYPES_TRACE_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace myo_core
{

class TraceView;

/**
 * @brief Uniformly sampled force recording
 *
 * Owns two equal-length sample vectors: time [s] and force [mN]. Time must
 * be strictly increasing. The sampling interval is the mean spacing between
 * consecutive samples, which absorbs the rounding jitter of exported time
 * columns.
 *
 * A Trace is immutable after construction. All analysis runs on TraceView
 * windows into it.
 *
 * @ticket 0001_trace_windowing
 */
class Trace
{
public:
  /**
   * @brief Construct from time and force samples
   *
   * @param time Sample times [s], strictly increasing
   * @param force Force samples [mN], same length as time
   * @throws std::invalid_argument if lengths differ or time is not strictly
   *         increasing
   */
  Trace(Eigen::VectorXd time, Eigen::VectorXd force);

  /**
   * @brief Convenience constructor from standard vectors
   * @throws std::invalid_argument as for the Eigen overload
   */
  Trace(const std::vector<double>& time, const std::vector<double>& force);

  [[nodiscard]] std::size_t size() const
  {
    return static_cast<std::size_t>(time_.size());
  }

  [[nodiscard]] bool empty() const { return time_.size() == 0; }

  [[nodiscard]] const Eigen::VectorXd& times() const { return time_; }
  [[nodiscard]] const Eigen::VectorXd& forces() const { return force_; }

  /**
   * @brief Mean sample spacing [s]
   *
   * Zero for traces with fewer than two samples.
   */
  [[nodiscard]] double samplingInterval() const { return samplingInterval_; }

  /// Time of the first sample [s]; 0 for an empty trace
  [[nodiscard]] double startTime() const;

  /**
   * @brief End of the covered time extent [s]
   *
   * Each sample covers one sampling interval, so the extent ends one interval
   * after the last sample. A 10 s recording at 250 Hz (last sample at
   * 9.996 s) covers [0, 10).
   */
  [[nodiscard]] double endTime() const;

  /// Covered extent, endTime() - startTime() [s]
  [[nodiscard]] double duration() const { return endTime() - startTime(); }

  /// View over every sample of the trace
  [[nodiscard]] TraceView view() const;

  /**
   * @brief View over [startTime, startTime + duration)
   *
   * Truncated to the trace extent; never throws for out-of-range windows.
   *
   * @throws std::invalid_argument if duration <= 0
   */
  [[nodiscard]] TraceView window(double startTime, double duration) const;

private:
  void validate() const;

  Eigen::VectorXd time_;
  Eigen::VectorXd force_;
  double samplingInterval_{0.0};
};

/**
 * @brief Non-owning analysis window over a contiguous range of a Trace
 *
 * Sample indices used by the view are local: index 0 is the first sample
 * inside the window. The window keeps its effective time extent separately
 * from its samples so that rate denominators use the true window duration
 * rather than the span between first and last sample.
 *
 * The referenced Trace must outlive the view.
 *
 * @ticket 0001_trace_windowing
 */
class TraceView
{
public:
  using ConstSegment = Eigen::Map<const Eigen::VectorXd>;

  TraceView(const Trace& trace,
            std::size_t offset,
            std::size_t count,
            double windowStart,
            double windowEnd);

  [[nodiscard]] std::size_t size() const { return count_; }
  [[nodiscard]] bool empty() const { return count_ == 0; }

  [[nodiscard]] double time(std::size_t i) const
  {
    return trace_->times()[static_cast<Eigen::Index>(offset_ + i)];
  }

  [[nodiscard]] double force(std::size_t i) const
  {
    return trace_->forces()[static_cast<Eigen::Index>(offset_ + i)];
  }

  [[nodiscard]] ConstSegment times() const;
  [[nodiscard]] ConstSegment forces() const;

  /// Index of the first window sample within the parent trace
  [[nodiscard]] std::size_t offset() const { return offset_; }

  [[nodiscard]] double samplingInterval() const
  {
    return trace_->samplingInterval();
  }

  /// Effective start of the window [s]
  [[nodiscard]] double startTime() const { return windowStart_; }

  /// Effective (exclusive) end of the window [s]
  [[nodiscard]] double endTime() const { return windowEnd_; }

  /// Effective window duration [s], used as the rate denominator
  [[nodiscard]] double duration() const { return windowEnd_ - windowStart_; }

  /**
   * @brief Sub-window [startTime, startTime + duration) clipped to this view
   * @throws std::invalid_argument if duration <= 0
   */
  [[nodiscard]] TraceView subWindow(double startTime, double duration) const;

private:
  const Trace* trace_;
  std::size_t offset_;
  std::size_t count_;
  double windowStart_;
  double windowEnd_;
};

}  // namespace myo_core

#endif  // MYO_CORE_DATA_TYPES_TRACE_HPP
