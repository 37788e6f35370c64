// Ticket: 0012_result_persistence

#include "myo-recorder/src/RecordConversions.hpp"

#include <limits>

namespace myo_recorder
{

namespace
{

uint32_t asFlag(bool value)
{
  return value ? 1U : 0U;
}

}  // namespace

double toColumn(const myo_core::Metric& value)
{
  return value.value_or(std::numeric_limits<double>::quiet_NaN());
}

// ========== MetricSet ==========

myo_transfer::MetricSetRecord toRecord(const myo_core::MetricSet& metrics)
{
  myo_transfer::MetricSetRecord record{};
  record.num_contractions = static_cast<uint32_t>(metrics.count);
  record.window_duration = metrics.windowDuration;
  record.frequency_cpm = metrics.frequencyCpm;
  record.baseline = toColumn(metrics.baselineTone);
  record.mean_amplitude = toColumn(metrics.meanAmplitude);
  record.amplitude_cv = toColumn(metrics.amplitudeCv);
  record.mean_period = toColumn(metrics.meanPeriod);
  record.period_cv = toColumn(metrics.periodCv);

  record.mean_duration = toColumn(metrics.meanDuration);
  record.mean_rise_time = toColumn(metrics.meanRiseTime);
  record.mean_relaxation_time = toColumn(metrics.meanRelaxationTime);
  record.mean_rise_fall_ratio = toColumn(metrics.meanRiseFallRatio);
  record.mean_max_rise_rate = toColumn(metrics.meanMaxRiseRate);
  record.mean_max_decline_rate = toColumn(metrics.meanMaxDeclineRate);
  record.mean_width_half_max = toColumn(metrics.meanHalfMaxWidth);
  record.mean_rise_time_10_90 = toColumn(metrics.meanRiseTime10to90);
  record.mean_rise_rate_10_90 = toColumn(metrics.meanRiseRate10to90);
  record.mean_relax_time_90_10 = toColumn(metrics.meanRelaxTime90to10);
  record.mean_relax_rate_90_10 = toColumn(metrics.meanRelaxRate90to10);

  record.total_integral = metrics.totalIntegral;
  record.trace_integral = metrics.traceIntegral;
  record.force_per_contraction = toColumn(metrics.forcePerContraction);
  record.force_per_minute = metrics.forcePerMinute;

  record.duty_cycle = metrics.dutyCyclePct;
  record.total_contraction_time = metrics.totalContractionTime;
  record.total_quiescent_time = metrics.totalQuiescentTime;
  record.mean_intercontraction_interval =
    toColumn(metrics.meanInterContractionInterval);
  record.num_incomplete_relaxation =
    static_cast<uint32_t>(metrics.incompleteRelaxationCount);
  record.incomplete_relaxation = toColumn(metrics.incompleteRelaxationPct);
  record.mean_quiescent_tone = toColumn(metrics.meanQuiescentTone);
  record.mean_tonic_force = toColumn(metrics.meanTonicForce);
  record.phasic_tonic_ratio = toColumn(metrics.phasicTonicRatio);

  record.amplitude_frequency_product =
    toColumn(metrics.amplitudeFrequencyProduct);
  record.contraction_work_index = toColumn(metrics.contractionWorkIndex);

  record.num_edge_truncated = static_cast<uint32_t>(metrics.edgeTruncatedCount);
  record.flag_low_amplitude = asFlag(metrics.flags.lowAmplitude);
  record.flag_low_count = asFlag(metrics.flags.lowCount);
  record.flag_edge_truncated = asFlag(metrics.flags.edgeTruncated);
  record.flag_insufficient_data = asFlag(metrics.flags.insufficientData);
  return record;
}

// ========== Contraction ==========

myo_transfer::ContractionRecord toRecord(const myo_core::Contraction& contraction,
                                         uint32_t ordinal,
                                         uint32_t recordingId)
{
  myo_transfer::ContractionRecord record{};
  record.ordinal = ordinal;
  record.peak_index = static_cast<uint32_t>(contraction.peak.index);
  record.peak_time = contraction.peak.time;
  record.peak_force = contraction.peak.force;
  record.start_time = contraction.start.time;
  record.start_force = contraction.start.force;
  record.end_time = contraction.end.time;
  record.end_force = contraction.end.force;
  record.amplitude = contraction.amplitude;
  record.prominence = contraction.prominence;

  record.duration = contraction.duration;
  record.rise_time = contraction.riseTime;
  record.relaxation_time = contraction.relaxationTime;
  record.rise_fall_ratio = toColumn(contraction.riseFallRatio);
  record.max_rise_rate = contraction.maxRiseRate;
  record.max_decline_rate = contraction.maxDeclineRate;
  record.integral = contraction.integral;
  record.width_half_max = toColumn(contraction.halfMaxWidth);
  record.rise_time_10_90 = toColumn(contraction.riseTime10to90);
  record.rise_rate_10_90 = toColumn(contraction.riseRate10to90);
  record.relax_time_90_10 = toColumn(contraction.relaxTime90to10);
  record.relax_rate_90_10 = toColumn(contraction.relaxRate90to10);

  record.start_truncated = asFlag(contraction.startTruncated);
  record.end_truncated = asFlag(contraction.endTruncated);
  record.start_at_trough = asFlag(contraction.startAtTrough);
  record.end_at_trough = asFlag(contraction.endAtTrough);
  record.recording.id = recordingId;
  return record;
}

// ========== Bins ==========

myo_transfer::BinMetricsRecord toRecord(const myo_core::BinMetrics& bin,
                                        uint32_t recordingId)
{
  myo_transfer::BinMetricsRecord record{};
  record.bin = static_cast<uint32_t>(bin.binIndex + 1);
  record.time_start = bin.startTime;
  record.time_end = bin.endTime;
  record.metrics = toRecord(bin.metrics);
  record.recording.id = recordingId;
  return record;
}

// ========== Recordings ==========

myo_transfer::RecordingRecord toRecord(const myo_core::RecordingResult& result,
                                       double amplitudeQualityThreshold)
{
  myo_transfer::RecordingRecord record{};
  record.name = result.name;
  record.recording_duration = result.recordingDuration;
  record.analyzed_duration = result.analyzedDuration;
  record.baseline = result.overall.baseline;
  record.num_contractions =
    static_cast<uint32_t>(result.overall.contractions.size());
  record.num_bins = static_cast<uint32_t>(result.bins.size());
  record.flagged = asFlag(result.flagged());
  record.flag_summary =
    result.metrics().flagSummary(amplitudeQualityThreshold);
  return record;
}

myo_transfer::RecordingRecord toRecord(const myo_core::RecordingFailure& failure)
{
  myo_transfer::RecordingRecord record{};
  record.name = failure.name;
  record.failed = 1U;
  record.failure_reason = failure.reason;
  return record;
}

}  // namespace myo_recorder
