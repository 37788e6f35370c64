// Ticket: 0009_recording_analysis

#ifndef MYO_CORE_PIPELINE_RECORDING_ANALYZER_HPP
#define MYO_CORE_PIPELINE_RECORDING_ANALYZER_HPP

#include <string>
#include <vector>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/MetricSet.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"
#include "myo-core/src/Pipeline/Binner.hpp"
#include "myo-core/src/Pipeline/WindowAnalyzer.hpp"

namespace myo_core
{

/**
 * @brief Result of analysing one recording
 */
struct RecordingResult
{
  std::string name;
  WindowAnalysis overall;        // Full analysis window
  std::vector<BinMetrics> bins;  // Time order, covering the analysis window
  double recordingDuration{0.0};  // Covered extent of the whole trace [s]
  double analyzedDuration{0.0};   // Effective analysis window [s]

  [[nodiscard]] const MetricSet& metrics() const { return overall.metrics; }

  /// True if the recording-level metrics raise any quality flag
  [[nodiscard]] bool flagged() const { return overall.metrics.flags.any(); }
};

/**
 * @brief Analyses a recording over [trace start, trace start + analysisWindow)
 *
 * Recordings shorter than the analysis window are analysed over the samples
 * available; rates use the shorter effective duration.
 *
 * @ticket 0009_recording_analysis
 */
class RecordingAnalyzer
{
public:
  /**
   * @throws std::invalid_argument if the configuration is invalid
   */
  explicit RecordingAnalyzer(const AnalysisConfig& config);

  /**
   * @brief Analyse one recording
   *
   * @param trace Force trace of the recording
   * @param name Identifier carried into the result
   * @return Recording-level metrics, contractions and bins
   * @throws InsufficientDataError if the analysis window holds fewer than two
   *         samples
   */
  [[nodiscard]] RecordingResult analyze(const Trace& trace,
                                        const std::string& name = {}) const;

  [[nodiscard]] const AnalysisConfig& config() const { return config_; }

private:
  AnalysisConfig config_;
  WindowAnalyzer windowAnalyzer_;
  Binner binner_;
};

}  // namespace myo_core

#endif  // MYO_CORE_PIPELINE_RECORDING_ANALYZER_HPP
