// Ticket: 0012_result_persistence

#ifndef MYO_TRANSFER_CONTRACTION_RECORD_HPP
#define MYO_TRANSFER_CONTRACTION_RECORD_HPP

#include <cstdint>
#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "myo-transfer/src/RecordingRecord.hpp"

namespace myo_transfer
{

/**
 * @brief Database record for one contraction of the full analysis window
 *
 * Undefined kinetic values (no 10-90% crossing, zero relaxation time) are
 * stored as NaN.
 *
 * @ticket 0012_result_persistence
 */
struct ContractionRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t ordinal{0};     // Position in the recording, from 1
  uint32_t peak_index{0};  // Sample index within the analysis window
  double peak_time{std::numeric_limits<double>::quiet_NaN()};    // [s]
  double peak_force{std::numeric_limits<double>::quiet_NaN()};   // [mN]
  double start_time{std::numeric_limits<double>::quiet_NaN()};   // [s]
  double start_force{std::numeric_limits<double>::quiet_NaN()};  // [mN]
  double end_time{std::numeric_limits<double>::quiet_NaN()};     // [s]
  double end_force{std::numeric_limits<double>::quiet_NaN()};    // [mN]
  double amplitude{std::numeric_limits<double>::quiet_NaN()};    // [mN]
  double prominence{std::numeric_limits<double>::quiet_NaN()};   // [mN]

  double duration{std::numeric_limits<double>::quiet_NaN()};         // [s]
  double rise_time{std::numeric_limits<double>::quiet_NaN()};        // [s]
  double relaxation_time{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double rise_fall_ratio{std::numeric_limits<double>::quiet_NaN()};
  double max_rise_rate{std::numeric_limits<double>::quiet_NaN()};     // [mN/s]
  double max_decline_rate{std::numeric_limits<double>::quiet_NaN()};  // [mN/s]
  double integral{std::numeric_limits<double>::quiet_NaN()};          // [mN*s]
  double width_half_max{std::numeric_limits<double>::quiet_NaN()};    // [s]
  double rise_time_10_90{std::numeric_limits<double>::quiet_NaN()};   // [s]
  double rise_rate_10_90{std::numeric_limits<double>::quiet_NaN()};   // [mN/s]
  double relax_time_90_10{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double relax_rate_90_10{std::numeric_limits<double>::quiet_NaN()};  // [mN/s]

  uint32_t start_truncated{0};  // Boolean as uint32_t for SQLite
  uint32_t end_truncated{0};
  uint32_t start_at_trough{0};
  uint32_t end_at_trough{0};

  cpp_sqlite::ForeignKey<RecordingRecord> recording;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(ContractionRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (ordinal,
                       peak_index,
                       peak_time,
                       peak_force,
                       start_time,
                       start_force,
                       end_time,
                       end_force,
                       amplitude,
                       prominence,
                       duration,
                       rise_time,
                       relaxation_time,
                       rise_fall_ratio,
                       max_rise_rate,
                       max_decline_rate,
                       integral,
                       width_half_max,
                       rise_time_10_90,
                       rise_rate_10_90,
                       relax_time_90_10,
                       relax_rate_90_10,
                       start_truncated,
                       end_truncated,
                       start_at_trough,
                       end_at_trough,
                       recording));

}  // namespace myo_transfer

#endif  // MYO_TRANSFER_CONTRACTION_RECORD_HPP
