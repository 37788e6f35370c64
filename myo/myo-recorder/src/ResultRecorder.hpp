// Ticket: 0012_result_persistence

#ifndef MYO_RECORDER_RESULT_RECORDER_HPP
#define MYO_RECORDER_RESULT_RECORDER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/Pipeline/BatchAnalyzer.hpp"
#include "myo-core/src/Pipeline/RecordingAnalyzer.hpp"

namespace myo_recorder
{

/**
 * @brief Writes analysis results to a SQLite database
 *
 * Schema (one table per transfer record):
 * - RecordingRecord: one row per recording, analysed or failed
 * - ContractionRecord: full-window contractions, FK to the recording
 * - RecordingMetricsRecord: full-window metrics, FK to the recording
 * - BinMetricsRecord: per-bin metrics, FK to the recording
 *
 * Recording IDs are pre-assigned atomically so child records can reference
 * their parent before anything is written. Records are buffered in the
 * cpp_sqlite DAOs and written by flush() inside a single transaction; the
 * destructor flushes whatever is still buffered.
 *
 * @ticket 0012_result_persistence
 */
class ResultRecorder
{
public:
  struct Config
  {
    std::string databasePath;  // Path to SQLite database file
  };

  /**
   * @brief Open (or create) the database and register every table
   *
   * @param config Database location
   * @param analysisConfig Parameters the results were produced with
   * @throws std::runtime_error if the database cannot be opened
   */
  ResultRecorder(const Config& config, const myo_core::AnalysisConfig& analysisConfig);

  ~ResultRecorder();

  ResultRecorder(const ResultRecorder&) = delete;
  ResultRecorder& operator=(const ResultRecorder&) = delete;
  ResultRecorder(ResultRecorder&&) = delete;
  ResultRecorder& operator=(ResultRecorder&&) = delete;

  /**
   * @brief Buffer a recording with its contractions, metrics and bins
   * @return Pre-assigned recording ID
   */
  uint32_t recordResult(const myo_core::RecordingResult& result);

  /**
   * @brief Buffer a failed recording with its failure reason
   * @return Pre-assigned recording ID
   */
  uint32_t recordFailure(const myo_core::RecordingFailure& failure);

  /**
   * @brief Buffer every result and failure of a batch, results first
   */
  void recordBatch(const myo_core::BatchResult& batch);

  /**
   * @brief Write all buffered records in one transaction
   * @throws std::runtime_error on database errors
   */
  void flush();

  /// Read-only access for queries
  const cpp_sqlite::Database& getDatabase() const;

private:
  std::unique_ptr<cpp_sqlite::Database> database_;
  myo_core::AnalysisConfig analysisConfig_;
  std::mutex flushMutex_;
  std::atomic<uint32_t> nextRecordingId_{1};
};

}  // namespace myo_recorder

#endif  // MYO_RECORDER_RESULT_RECORDER_HPP
