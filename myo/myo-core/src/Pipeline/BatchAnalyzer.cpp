// Ticket: 0010_batch_analysis

#include "myo-core/src/Pipeline/BatchAnalyzer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace myo_core
{

namespace
{

// Exactly one of the two members is set once the recording has been processed
struct Slot
{
  std::optional<RecordingResult> result;
  std::optional<RecordingFailure> failure;
};

}  // namespace

std::vector<std::string> BatchResult::flaggedNames() const
{
  std::vector<std::string> names;
  for (const auto& result : results)
  {
    if (result.flagged())
    {
      names.push_back(result.name);
    }
  }
  return names;
}

std::vector<std::string> BatchResult::failedNames() const
{
  std::vector<std::string> names;
  names.reserve(failures.size());
  for (const auto& failure : failures)
  {
    names.push_back(failure.name);
  }
  return names;
}

BatchAnalyzer::BatchAnalyzer(const AnalysisConfig& analysisConfig,
                             const Config& config,
                             std::shared_ptr<spdlog::logger> logger)
  : analyzer_{analysisConfig},
    config_{config},
    logger_{logger ? std::move(logger) : spdlog::default_logger()}
{
}

BatchAnalyzer::BatchAnalyzer(const AnalysisConfig& analysisConfig)
  : BatchAnalyzer{analysisConfig, Config{}}
{
}

std::size_t BatchAnalyzer::workersFor(std::size_t recordingCount) const
{
  std::size_t workers = config_.workerCount;
  if (workers == 0)
  {
    workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  return std::clamp<std::size_t>(workers, 1, std::max<std::size_t>(1, recordingCount));
}

BatchResult BatchAnalyzer::analyze(const std::vector<NamedTrace>& recordings) const
{
  std::vector<Slot> slots(recordings.size());
  std::atomic<std::size_t> nextIndex{0};

  auto work = [&]()
  {
    for (std::size_t i = nextIndex.fetch_add(1); i < recordings.size();
         i = nextIndex.fetch_add(1))
    {
      const NamedTrace& recording = recordings[i];
      try
      {
        slots[i].result = analyzer_.analyze(recording.trace, recording.name);
      }
      catch (const std::exception& e)
      {
        slots[i].failure = RecordingFailure{recording.name, e.what()};
      }
    }
  };

  std::size_t const workerCount = workersFor(recordings.size());
  logger_->info("Analysing {} recordings on {} workers ({})",
                recordings.size(),
                workerCount,
                analyzer_.config().describe());
  {
    std::vector<std::jthread> workers;
    workers.reserve(workerCount);
    for (std::size_t w = 0; w < workerCount; ++w)
    {
      workers.emplace_back(work);
    }
  }

  BatchResult batch{};
  for (auto& slot : slots)
  {
    if (slot.failure)
    {
      logger_->error("Failed to analyse '{}': {}",
                     slot.failure->name,
                     slot.failure->reason);
      batch.failures.push_back(std::move(*slot.failure));
      continue;
    }

    if (slot.result->flagged())
    {
      logger_->warn("Recording '{}' flagged for review: {}",
                    slot.result->name,
                    slot.result->metrics().flagSummary(
                      analyzer_.config().amplitudeQualityThreshold));
    }
    batch.results.push_back(std::move(*slot.result));
  }

  logger_->info("Batch complete: {} analysed, {} failed, {} flagged",
                batch.results.size(),
                batch.failures.size(),
                batch.flaggedNames().size());
  return batch;
}

}  // namespace myo_core
