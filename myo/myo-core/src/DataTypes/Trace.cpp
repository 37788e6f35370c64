// Ticket: 0001_trace_windowing

#include "myo-core/src/DataTypes/Trace.hpp"

#include <algorithm>
#include <utility>
#include <sstream>
#include <stdexcept>

namespace myo_core
{

namespace
{

Eigen::VectorXd toEigen(const std::vector<double>& values)
{
  return Eigen::Map<const Eigen::VectorXd>(values.data(),
                                           static_cast<Eigen::Index>(values.size()));
}

// First index in [first, last) whose time is >= t
std::size_t lowerBound(const Eigen::VectorXd& times,
                       std::size_t first,
                       std::size_t last,
                       double t)
{
  const double* begin = times.data();
  return static_cast<std::size_t>(
    std::lower_bound(begin + first, begin + last, t) - begin);
}

}  // namespace

// ========== Trace ==========

Trace::Trace(Eigen::VectorXd time, Eigen::VectorXd force)
  : time_{std::move(time)}, force_{std::move(force)}
{
  validate();

  if (time_.size() > 1)
  {
    samplingInterval_ =
      (time_[time_.size() - 1] - time_[0]) / static_cast<double>(time_.size() - 1);
  }
}

Trace::Trace(const std::vector<double>& time, const std::vector<double>& force)
  : Trace{toEigen(time), toEigen(force)}
{
}

void Trace::validate() const
{
  if (time_.size() != force_.size())
  {
    std::ostringstream oss;
    oss << "Trace time and force lengths differ: " << time_.size()
        << " vs " << force_.size();
    throw std::invalid_argument(oss.str());
  }

  for (Eigen::Index i = 1; i < time_.size(); ++i)
  {
    if (!(time_[i] > time_[i - 1]))
    {
      std::ostringstream oss;
      oss << "Trace time must be strictly increasing (sample " << i
          << ": " << time_[i - 1] << " -> " << time_[i] << ")";
      throw std::invalid_argument(oss.str());
    }
  }
}

double Trace::startTime() const
{
  return empty() ? 0.0 : time_[0];
}

double Trace::endTime() const
{
  return empty() ? 0.0 : time_[time_.size() - 1] + samplingInterval_;
}

TraceView Trace::view() const
{
  return TraceView{*this, 0, size(), startTime(), endTime()};
}

TraceView Trace::window(double startTime, double duration) const
{
  return view().subWindow(startTime, duration);
}

// ========== TraceView ==========

TraceView::TraceView(const Trace& trace,
                     std::size_t offset,
                     std::size_t count,
                     double windowStart,
                     double windowEnd)
  : trace_{&trace},
    offset_{offset},
    count_{count},
    windowStart_{windowStart},
    windowEnd_{std::max(windowStart, windowEnd)}
{
  if (offset_ + count_ > trace.size())
  {
    throw std::invalid_argument("TraceView range exceeds trace length");
  }
}

TraceView::ConstSegment TraceView::times() const
{
  return ConstSegment{trace_->times().data() + offset_,
                      static_cast<Eigen::Index>(count_)};
}

TraceView::ConstSegment TraceView::forces() const
{
  return ConstSegment{trace_->forces().data() + offset_,
                      static_cast<Eigen::Index>(count_)};
}

TraceView TraceView::subWindow(double startTime, double duration) const
{
  if (!(duration > 0.0))
  {
    std::ostringstream oss;
    oss << "Window duration must be positive, got " << duration;
    throw std::invalid_argument(oss.str());
  }

  double const start = std::clamp(startTime, windowStart_, windowEnd_);
  double const end = std::clamp(startTime + duration, start, windowEnd_);

  std::size_t const last = offset_ + count_;
  std::size_t const first = lowerBound(trace_->times(), offset_, last, start);
  std::size_t const stop = lowerBound(trace_->times(), first, last, end);

  return TraceView{*trace_, first, stop - first, start, end};
}

}  // namespace myo_core
