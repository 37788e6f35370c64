// Ticket: 0011_cross_recording_summary

#include "myo-core/src/Metrics/CrossRecordingSummary.hpp"

#include <sstream>
#include <stdexcept>

namespace myo_core
{

namespace
{

class SummaryAccumulator
{
public:
  void add(const Metric& value)
  {
    if (!value)
    {
      ++summary_.absent;
      return;
    }
    sum_ += *value;
    ++summary_.contributing;
  }

  [[nodiscard]] FieldSummary finish() const
  {
    FieldSummary result = summary_;
    if (result.contributing > 0)
    {
      result.mean = sum_ / static_cast<double>(result.contributing);
    }
    return result;
  }

private:
  FieldSummary summary_{};
  double sum_{0.0};
};

}  // namespace

FieldSummary summarizeField(std::span<const MetricSet> metricSets,
                            Metric MetricSet::*field)
{
  SummaryAccumulator accumulator;
  for (const auto& metrics : metricSets)
  {
    accumulator.add(metrics.*field);
  }
  return accumulator.finish();
}

FieldSummary summarizeField(std::span<const MetricSet> metricSets,
                            double MetricSet::*field)
{
  SummaryAccumulator accumulator;
  for (const auto& metrics : metricSets)
  {
    accumulator.add(metrics.*field);
  }
  return accumulator.finish();
}

FieldSummary summarizeField(std::span<const MetricSet> metricSets,
                            const std::string& fieldName)
{
  SummaryAccumulator accumulator;
  bool known = metricSets.empty();
  for (const auto& metrics : metricSets)
  {
    bool found = false;
    for (const auto& [name, value] : metrics.toFieldMap())
    {
      if (name == fieldName)
      {
        accumulator.add(value);
        found = true;
        break;
      }
    }
    known = known || found;
  }

  if (!known)
  {
    std::ostringstream oss;
    oss << "Unknown metric field '" << fieldName << "'";
    throw std::invalid_argument(oss.str());
  }
  return accumulator.finish();
}

std::vector<std::pair<std::string, FieldSummary>> summarizeAll(
  std::span<const MetricSet> metricSets)
{
  std::vector<std::pair<std::string, FieldSummary>> summaries;
  if (metricSets.empty())
  {
    return summaries;
  }

  std::vector<SummaryAccumulator> accumulators;
  for (const auto& metrics : metricSets)
  {
    FieldMap const fields = metrics.toFieldMap();
    if (accumulators.empty())
    {
      accumulators.resize(fields.size());
      for (const auto& field : fields)
      {
        summaries.emplace_back(field.first, FieldSummary{});
      }
    }
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
      accumulators[i].add(fields[i].second);
    }
  }

  for (std::size_t i = 0; i < summaries.size(); ++i)
  {
    summaries[i].second = accumulators[i].finish();
  }
  return summaries;
}

}  // namespace myo_core
