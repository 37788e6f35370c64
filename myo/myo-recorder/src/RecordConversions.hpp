// Ticket: 0012_result_persistence

#ifndef MYO_RECORDER_RECORD_CONVERSIONS_HPP
#define MYO_RECORDER_RECORD_CONVERSIONS_HPP

#include <cstdint>

#include "myo-core/src/DataTypes/Contraction.hpp"
#include "myo-core/src/DataTypes/MetricSet.hpp"
#include "myo-core/src/Pipeline/BatchAnalyzer.hpp"
#include "myo-core/src/Pipeline/RecordingAnalyzer.hpp"
#include "myo-transfer/src/Records.hpp"

namespace myo_recorder
{

/// Absent metrics map to quiet NaN
[[nodiscard]] double toColumn(const myo_core::Metric& value);

[[nodiscard]] myo_transfer::MetricSetRecord toRecord(
  const myo_core::MetricSet& metrics);

/**
 * @param contraction Contraction of the full analysis window
 * @param ordinal Position in the recording, from 1
 * @param recordingId Pre-assigned id of the owning RecordingRecord
 */
[[nodiscard]] myo_transfer::ContractionRecord toRecord(
  const myo_core::Contraction& contraction,
  uint32_t ordinal,
  uint32_t recordingId);

[[nodiscard]] myo_transfer::BinMetricsRecord toRecord(
  const myo_core::BinMetrics& bin,
  uint32_t recordingId);

/**
 * @param result Analysed recording
 * @param amplitudeQualityThreshold Threshold quoted in the flag summary [mN]
 */
[[nodiscard]] myo_transfer::RecordingRecord toRecord(
  const myo_core::RecordingResult& result,
  double amplitudeQualityThreshold);

[[nodiscard]] myo_transfer::RecordingRecord toRecord(
  const myo_core::RecordingFailure& failure);

}  // namespace myo_recorder

#endif  // MYO_RECORDER_RECORD_CONVERSIONS_HPP
