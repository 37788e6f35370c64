// Ticket: 0007_window_pipeline

#include "myo-core/src/Pipeline/WindowAnalyzer.hpp"

#include <spdlog/spdlog.h>

#include "myo-core/src/Detection/BaselineEstimator.hpp"
#include "myo-core/src/Kinetics/KineticsCalculator.hpp"

namespace myo_core
{

WindowAnalyzer::WindowAnalyzer(const AnalysisConfig& config)
  : config_{config},
    detector_{config},
    resolver_{config},
    aggregator_{config}
{
}

WindowAnalysis WindowAnalyzer::analyze(const TraceView& view) const
{
  WindowAnalysis analysis{};
  analysis.baseline = BaselineEstimator::estimate(view);

  auto const peaks = detector_.detect(view, analysis.baseline);
  analysis.contractions = resolver_.resolve(view, analysis.baseline, peaks);
  KineticsCalculator::computeAll(view, analysis.baseline, analysis.contractions);
  analysis.metrics =
    aggregator_.aggregate(view, analysis.baseline, analysis.contractions);

  spdlog::debug("Window [{:.3f}, {:.3f}) s: baseline {:.4f} mN, {} contractions",
                view.startTime(),
                view.endTime(),
                analysis.baseline,
                analysis.contractions.size());
  return analysis;
}

}  // namespace myo_core
