// Ticket: 0009_recording_analysis

#include "myo-core/src/Pipeline/RecordingAnalyzer.hpp"

#include <spdlog/spdlog.h>

namespace myo_core
{

RecordingAnalyzer::RecordingAnalyzer(const AnalysisConfig& config)
  : config_{config}, windowAnalyzer_{config}, binner_{config}
{
}

RecordingResult RecordingAnalyzer::analyze(const Trace& trace,
                                           const std::string& name) const
{
  RecordingResult result{};
  result.name = name;
  result.recordingDuration = trace.duration();

  TraceView const window =
    trace.window(trace.startTime(), config_.analysisWindow);
  result.analyzedDuration = window.duration();

  if (result.analyzedDuration < config_.analysisWindow)
  {
    spdlog::debug("Recording '{}' covers {:.3f} s, shorter than the {:.1f} s "
                  "analysis window",
                  name,
                  result.analyzedDuration,
                  config_.analysisWindow);
  }

  result.overall = windowAnalyzer_.analyze(window);
  result.bins = binner_.bin(window);

  if (result.flagged())
  {
    spdlog::warn("Recording '{}': {}",
                 name,
                 result.overall.metrics.flagSummary(
                   config_.amplitudeQualityThreshold));
  }

  return result;
}

}  // namespace myo_core
