#ifndef MYO_TRANSFER_RECORDS_HPP
#define MYO_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all database transfer objects
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "myo-transfer/src/BinMetricsRecord.hpp"
#include "myo-transfer/src/ContractionRecord.hpp"
#include "myo-transfer/src/MetricSetRecord.hpp"
#include "myo-transfer/src/RecordingMetricsRecord.hpp"
#include "myo-transfer/src/RecordingRecord.hpp"

namespace myo_transfer
{

using Database = cpp_sqlite::Database;

}  // namespace myo_transfer

#endif  // MYO_TRANSFER_RECORDS_HPP
