// Ticket: 0012_result_persistence

#ifndef MYO_TRANSFER_RECORDING_RECORD_HPP
#define MYO_TRANSFER_RECORDING_RECORD_HPP

#include <cstdint>
#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace myo_transfer
{

/**
 * @brief Database record for one analysed (or failed) recording
 *
 * Every per-recording record references this one via
 * ForeignKey<RecordingRecord>. Failed recordings are stored with
 * failed = 1 and the failure reason, and have no child records.
 *
 * @ticket 0012_result_persistence
 */
struct RecordingRecord : public cpp_sqlite::BaseTransferObject
{
  std::string name;
  double recording_duration{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double analyzed_duration{std::numeric_limits<double>::quiet_NaN()};   // [s]
  double baseline{std::numeric_limits<double>::quiet_NaN()};            // [mN]
  uint32_t num_contractions{0};
  uint32_t num_bins{0};
  uint32_t flagged{0};  // Boolean as uint32_t for SQLite
  std::string flag_summary;
  uint32_t failed{0};   // Boolean as uint32_t for SQLite
  std::string failure_reason;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(RecordingRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (name,
                       recording_duration,
                       analyzed_duration,
                       baseline,
                       num_contractions,
                       num_bins,
                       flagged,
                       flag_summary,
                       failed,
                       failure_reason));

}  // namespace myo_transfer

#endif  // MYO_TRANSFER_RECORDING_RECORD_HPP
