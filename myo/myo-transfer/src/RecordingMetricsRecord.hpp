// Ticket: 0012_result_persistence

#ifndef MYO_TRANSFER_RECORDING_METRICS_RECORD_HPP
#define MYO_TRANSFER_RECORDING_METRICS_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "myo-transfer/src/MetricSetRecord.hpp"
#include "myo-transfer/src/RecordingRecord.hpp"

namespace myo_transfer
{

/**
 * @brief Metrics of the full analysis window of one recording
 *
 * @ticket 0012_result_persistence
 */
struct RecordingMetricsRecord : public cpp_sqlite::BaseTransferObject
{
  MetricSetRecord metrics;
  cpp_sqlite::ForeignKey<RecordingRecord> recording;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(RecordingMetricsRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (metrics, recording));

}  // namespace myo_transfer

#endif  // MYO_TRANSFER_RECORDING_METRICS_RECORD_HPP
