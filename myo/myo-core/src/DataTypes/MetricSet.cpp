// Ticket: 0006_metric_aggregation

#include "myo-core/src/DataTypes/MetricSet.hpp"

#include <spdlog/fmt/fmt.h>

namespace myo_core
{

namespace
{

Metric asMetric(std::size_t value)
{
  return static_cast<double>(value);
}

Metric asMetric(bool value)
{
  return value ? 1.0 : 0.0;
}

}  // namespace

FieldMap MetricSet::toFieldMap() const
{
  return {
    {"num_contractions", asMetric(count)},
    {"window_duration_sec", windowDuration},
    {"frequency_cpm", frequencyCpm},
    {"baseline_mN", baselineTone},
    {"mean_amplitude_mN", meanAmplitude},
    {"amplitude_cv_pct", amplitudeCv},
    {"mean_period_sec", meanPeriod},
    {"period_cv_pct", periodCv},
    {"mean_duration_sec", meanDuration},
    {"mean_rise_time_sec", meanRiseTime},
    {"mean_relaxation_time_sec", meanRelaxationTime},
    {"mean_rise_fall_ratio", meanRiseFallRatio},
    {"mean_max_rise_rate_mN_per_sec", meanMaxRiseRate},
    {"mean_max_decline_rate_mN_per_sec", meanMaxDeclineRate},
    {"mean_width_half_max_sec", meanHalfMaxWidth},
    {"mean_rise_time_10_90_sec", meanRiseTime10to90},
    {"mean_rise_rate_10_90_mN_per_sec", meanRiseRate10to90},
    {"mean_relax_time_90_10_sec", meanRelaxTime90to10},
    {"mean_relax_rate_90_10_mN_per_sec", meanRelaxRate90to10},
    {"total_integral_mN_sec", totalIntegral},
    {"trace_integral_mN_sec", traceIntegral},
    {"force_per_contraction_mN_sec", forcePerContraction},
    {"force_per_minute_mN_sec_per_min", forcePerMinute},
    {"duty_cycle_pct", dutyCyclePct},
    {"total_contraction_time_sec", totalContractionTime},
    {"total_quiescent_time_sec", totalQuiescentTime},
    {"mean_intercontraction_interval_sec", meanInterContractionInterval},
    {"n_incomplete_relaxation", asMetric(incompleteRelaxationCount)},
    {"incomplete_relaxation_pct", incompleteRelaxationPct},
    {"mean_quiescent_tone_mN", meanQuiescentTone},
    {"mean_tonic_force_mN", meanTonicForce},
    {"phasic_tonic_ratio", phasicTonicRatio},
    {"amplitude_frequency_product", amplitudeFrequencyProduct},
    {"contraction_work_index", contractionWorkIndex},
    {"n_edge_truncated", asMetric(edgeTruncatedCount)},
    {"flag_low_amplitude", asMetric(flags.lowAmplitude)},
    {"flag_low_count", asMetric(flags.lowCount)},
    {"flag_edge_truncated", asMetric(flags.edgeTruncated)},
    {"flag_insufficient_data", asMetric(flags.insufficientData)},
  };
}

std::string MetricSet::flagSummary(double amplitudeQualityThreshold) const
{
  std::string summary;
  auto append = [&summary](const std::string& text)
  {
    if (!summary.empty())
    {
      summary += "; ";
    }
    summary += text;
  };

  if (flags.lowAmplitude && meanAmplitude)
  {
    append(fmt::format("LOW_AMP ({:.4f} mN < {} mN) - Review validation plot",
                       *meanAmplitude,
                       amplitudeQualityThreshold));
  }
  if (flags.lowCount)
  {
    append(fmt::format("LOW_COUNT (n={})", count));
  }
  if (flags.edgeTruncated)
  {
    append(fmt::format("EDGE_TRUNCATED (n={})", edgeTruncatedCount));
  }
  if (flags.insufficientData)
  {
    append("INSUFFICIENT_DATA");
  }
  return summary;
}

FieldMap BinMetrics::toFieldMap() const
{
  FieldMap fields{
    {"bin", static_cast<double>(binIndex + 1)},
    {"time_start_sec", startTime},
    {"time_end_sec", endTime},
  };
  FieldMap metricFields = metrics.toFieldMap();
  fields.insert(fields.end(), metricFields.begin(), metricFields.end());
  return fields;
}

}  // namespace myo_core
