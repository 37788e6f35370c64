// Ticket: 0012_result_persistence

#include "myo-recorder/src/ResultRecorder.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "myo-recorder/src/RecordConversions.hpp"
#include "myo-transfer/src/Records.hpp"

namespace myo_recorder
{

ResultRecorder::ResultRecorder(const Config& config,
                               const myo_core::AnalysisConfig& analysisConfig)
  : analysisConfig_{analysisConfig}
{
  spdlog::debug("Opening result database: {}", config.databasePath);
  database_ = std::make_unique<cpp_sqlite::Database>(config.databasePath, true);

  // Parent table first for FK integrity, then the nested sub-record before
  // the records that embed it
  database_->getDAO<myo_transfer::RecordingRecord>();
  database_->getDAO<myo_transfer::MetricSetRecord>();
  database_->getDAO<myo_transfer::ContractionRecord>();
  database_->getDAO<myo_transfer::RecordingMetricsRecord>();
  database_->getDAO<myo_transfer::BinMetricsRecord>();
}

ResultRecorder::~ResultRecorder()
{
  try
  {
    flush();
  }
  catch (const std::exception& e)
  {
    spdlog::error("Failed to flush result database on close: {}", e.what());
  }
}

uint32_t ResultRecorder::recordResult(const myo_core::RecordingResult& result)
{
  const uint32_t recordingId = nextRecordingId_.fetch_add(1);

  auto recording = toRecord(result, analysisConfig_.amplitudeQualityThreshold);
  recording.id = recordingId;
  database_->getDAO<myo_transfer::RecordingRecord>().addToBuffer(recording);

  auto& contractionDAO = database_->getDAO<myo_transfer::ContractionRecord>();
  uint32_t ordinal = 1;
  for (const auto& contraction : result.overall.contractions)
  {
    auto record = toRecord(contraction, ordinal++, recordingId);
    contractionDAO.addToBuffer(record);
  }

  myo_transfer::RecordingMetricsRecord metrics{};
  metrics.metrics = toRecord(result.metrics());
  metrics.recording.id = recordingId;
  database_->getDAO<myo_transfer::RecordingMetricsRecord>().addToBuffer(metrics);

  auto& binDAO = database_->getDAO<myo_transfer::BinMetricsRecord>();
  for (const auto& bin : result.bins)
  {
    auto record = toRecord(bin, recordingId);
    binDAO.addToBuffer(record);
  }

  return recordingId;
}

uint32_t ResultRecorder::recordFailure(const myo_core::RecordingFailure& failure)
{
  const uint32_t recordingId = nextRecordingId_.fetch_add(1);

  auto record = toRecord(failure);
  record.id = recordingId;
  database_->getDAO<myo_transfer::RecordingRecord>().addToBuffer(record);

  return recordingId;
}

void ResultRecorder::recordBatch(const myo_core::BatchResult& batch)
{
  for (const auto& result : batch.results)
  {
    recordResult(result);
  }
  for (const auto& failure : batch.failures)
  {
    recordFailure(failure);
  }
  spdlog::debug("Buffered {} recordings and {} failures",
                batch.results.size(),
                batch.failures.size());
}

void ResultRecorder::flush()
{
  std::scoped_lock lock{flushMutex_};
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

const cpp_sqlite::Database& ResultRecorder::getDatabase() const
{
  return *database_;
}

}  // namespace myo_recorder
