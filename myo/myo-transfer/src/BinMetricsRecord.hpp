// Ticket: 0012_result_persistence

#ifndef MYO_TRANSFER_BIN_METRICS_RECORD_HPP
#define MYO_TRANSFER_BIN_METRICS_RECORD_HPP

#include <cstdint>
#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "myo-transfer/src/MetricSetRecord.hpp"
#include "myo-transfer/src/RecordingRecord.hpp"

namespace myo_transfer
{

/**
 * @brief Metrics of one temporal bin of a recording
 *
 * bin is 1-based, matching the exported bin tables.
 *
 * @ticket 0012_result_persistence
 */
struct BinMetricsRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t bin{0};
  double time_start{std::numeric_limits<double>::quiet_NaN()};  // [s]
  double time_end{std::numeric_limits<double>::quiet_NaN()};    // [s]
  MetricSetRecord metrics;
  cpp_sqlite::ForeignKey<RecordingRecord> recording;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(BinMetricsRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (bin, time_start, time_end, metrics, recording));

}  // namespace myo_transfer

#endif  // MYO_TRANSFER_BIN_METRICS_RECORD_HPP
