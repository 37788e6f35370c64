// Ticket: 0012_result_persistence

#ifndef MYO_TRANSFER_METRIC_SET_RECORD_HPP
#define MYO_TRANSFER_METRIC_SET_RECORD_HPP

#include <cstdint>
#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace myo_transfer
{

/**
 * @brief Sub-record holding the metrics of one analysis window
 *
 * Nested inside RecordingMetricsRecord and BinMetricsRecord. Absent metrics
 * are stored as NaN; counts and flags are always present.
 *
 * @ticket 0012_result_persistence
 */
struct MetricSetRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t num_contractions{0};
  double window_duration{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double frequency_cpm{std::numeric_limits<double>::quiet_NaN()};  // [1/min]
  double baseline{std::numeric_limits<double>::quiet_NaN()};  // [mN]
  double mean_amplitude{std::numeric_limits<double>::quiet_NaN()};  // [mN]
  double amplitude_cv{std::numeric_limits<double>::quiet_NaN()};  // [%]
  double mean_period{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double period_cv{std::numeric_limits<double>::quiet_NaN()};  // [%]
  double mean_duration{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_rise_time{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_relaxation_time{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_rise_fall_ratio{std::numeric_limits<double>::quiet_NaN()};
  double mean_max_rise_rate{std::numeric_limits<double>::quiet_NaN()};  // [mN/s]
  double mean_max_decline_rate{std::numeric_limits<double>::quiet_NaN()};  // [mN/s]
  double mean_width_half_max{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_rise_time_10_90{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_rise_rate_10_90{std::numeric_limits<double>::quiet_NaN()};  // [mN/s]
  double mean_relax_time_90_10{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_relax_rate_90_10{std::numeric_limits<double>::quiet_NaN()};  // [mN/s]
  double total_integral{std::numeric_limits<double>::quiet_NaN()};  // [mN*s]
  double trace_integral{std::numeric_limits<double>::quiet_NaN()};  // [mN*s]
  double force_per_contraction{std::numeric_limits<double>::quiet_NaN()};  // [mN*s]
  double force_per_minute{std::numeric_limits<double>::quiet_NaN()};  // [mN*s/min]
  double duty_cycle{std::numeric_limits<double>::quiet_NaN()};  // [%]
  double total_contraction_time{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double total_quiescent_time{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double mean_intercontraction_interval{std::numeric_limits<double>::quiet_NaN()};  // [s]
  uint32_t num_incomplete_relaxation{0};
  double incomplete_relaxation{std::numeric_limits<double>::quiet_NaN()};  // [%]
  double mean_quiescent_tone{std::numeric_limits<double>::quiet_NaN()};  // [mN]
  double mean_tonic_force{std::numeric_limits<double>::quiet_NaN()};  // [mN]
  double phasic_tonic_ratio{std::numeric_limits<double>::quiet_NaN()};
  double amplitude_frequency_product{std::numeric_limits<double>::quiet_NaN()};  // [mN/min]
  double contraction_work_index{std::numeric_limits<double>::quiet_NaN()};  // [mN*s/min]
  uint32_t num_edge_truncated{0};
  uint32_t flag_low_amplitude{0};  // Boolean as uint32_t for SQLite
  uint32_t flag_low_count{0};
  uint32_t flag_edge_truncated{0};
  uint32_t flag_insufficient_data{0};
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(MetricSetRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (num_contractions,
                       window_duration,
                       frequency_cpm,
                       baseline,
                       mean_amplitude,
                       amplitude_cv,
                       mean_period,
                       period_cv,
                       mean_duration,
                       mean_rise_time,
                       mean_relaxation_time,
                       mean_rise_fall_ratio,
                       mean_max_rise_rate,
                       mean_max_decline_rate,
                       mean_width_half_max,
                       mean_rise_time_10_90,
                       mean_rise_rate_10_90,
                       mean_relax_time_90_10,
                       mean_relax_rate_90_10,
                       total_integral,
                       trace_integral,
                       force_per_contraction,
                       force_per_minute,
                       duty_cycle,
                       total_contraction_time,
                       total_quiescent_time,
                       mean_intercontraction_interval,
                       num_incomplete_relaxation,
                       incomplete_relaxation,
                       mean_quiescent_tone,
                       mean_tonic_force,
                       phasic_tonic_ratio,
                       amplitude_frequency_product,
                       contraction_work_index,
                       num_edge_truncated,
                       flag_low_amplitude,
                       flag_low_count,
                       flag_edge_truncated,
                       flag_insufficient_data));

}  // namespace myo_transfer

#endif  // MYO_TRANSFER_METRIC_SET_RECORD_HPP
