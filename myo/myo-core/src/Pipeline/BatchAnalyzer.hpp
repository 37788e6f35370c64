// Ticket: 0010_batch_analysis

#ifndef MYO_CORE_PIPELINE_BATCH_ANALYZER_HPP
#define MYO_CORE_PIPELINE_BATCH_ANALYZER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"
#include "myo-core/src/Pipeline/RecordingAnalyzer.hpp"

namespace myo_core
{

/**
 * @brief A recording queued for batch analysis
 */
struct NamedTrace
{
  std::string name;
  Trace trace;
};

/**
 * @brief A recording that could not be analysed
 */
struct RecordingFailure
{
  std::string name;
  std::string reason;
};

/**
 * @brief Outcome of a batch
 *
 * Successful results and failures each keep the input order of their
 * recordings.
 */
struct BatchResult
{
  std::vector<RecordingResult> results;
  std::vector<RecordingFailure> failures;

  /// Names of successful recordings whose metrics raise a quality flag
  [[nodiscard]] std::vector<std::string> flaggedNames() const;

  /// Names of recordings that failed
  [[nodiscard]] std::vector<std::string> failedNames() const;
};

/**
 * @brief Analyses many recordings as independent units of work
 *
 * Recordings share no mutable state, so they are distributed over a bounded
 * pool of worker threads that claim indices from an atomic counter. Each
 * worker writes only the result slot of the recording it claimed.
 *
 * A recording that throws (too few samples, malformed input) is reported by
 * name with its reason and never aborts the rest of the batch.
 *
 * @ticket 0010_batch_analysis
 */
class BatchAnalyzer
{
public:
  struct Config
  {
    std::size_t workerCount{0};  // 0 selects the hardware concurrency
  };

  /**
   * @param analysisConfig Parameters applied uniformly to every recording
   * @param config Worker pool settings
   * @param logger Destination for progress and failure messages; the spdlog
   *               default logger when null
   * @throws std::invalid_argument if analysisConfig is invalid
   */
  BatchAnalyzer(const AnalysisConfig& analysisConfig,
                const Config& config,
                std::shared_ptr<spdlog::logger> logger = nullptr);

  explicit BatchAnalyzer(const AnalysisConfig& analysisConfig);

  /**
   * @brief Analyse every recording
   * @param recordings Recordings in the order results are reported
   */
  [[nodiscard]] BatchResult analyze(const std::vector<NamedTrace>& recordings) const;

  /// Worker threads used for a batch of the given size
  [[nodiscard]] std::size_t workersFor(std::size_t recordingCount) const;

private:
  RecordingAnalyzer analyzer_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace myo_core

#endif  // MYO_CORE_PIPELINE_BATCH_ANALYZER_HPP
