// Ticket: 0011_cross_recording_summary

#ifndef MYO_CORE_METRICS_CROSS_RECORDING_SUMMARY_HPP
#define MYO_CORE_METRICS_CROSS_RECORDING_SUMMARY_HPP

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "myo-core/src/DataTypes/Contraction.hpp"
#include "myo-core/src/DataTypes/MetricSet.hpp"

namespace myo_core
{

/**
 * @brief Mean of one metric across recordings
 *
 * Absent values are skipped, never counted as zero. The mean itself is
 * absent when no recording contributes.
 */
struct FieldSummary
{
  Metric mean;
  std::size_t contributing{0};
  std::size_t absent{0};
};

/**
 * @brief Summarise an optional metric across metric sets
 *
 * @param metricSets Per-recording (or per-bin) metrics
 * @param field Member to summarise, e.g. &MetricSet::meanPeriod
 */
[[nodiscard]] FieldSummary summarizeField(std::span<const MetricSet> metricSets,
                                          Metric MetricSet::*field);

/// Overload for always-defined members such as &MetricSet::frequencyCpm
[[nodiscard]] FieldSummary summarizeField(std::span<const MetricSet> metricSets,
                                          double MetricSet::*field);

/**
 * @brief Summarise a named column of MetricSet::toFieldMap()
 *
 * @throws std::invalid_argument if no field carries the given name
 */
[[nodiscard]] FieldSummary summarizeField(std::span<const MetricSet> metricSets,
                                          const std::string& fieldName);

/**
 * @brief Summary of every field of MetricSet::toFieldMap(), in field order
 */
[[nodiscard]] std::vector<std::pair<std::string, FieldSummary>> summarizeAll(
  std::span<const MetricSet> metricSets);

}  // namespace myo_core

#endif  // MYO_CORE_METRICS_CROSS_RECORDING_SUMMARY_HPP
