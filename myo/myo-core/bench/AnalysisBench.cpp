// Ticket: 0009_recording_analysis
// Purpose: Profile detection and full-recording analysis on realistic traces

#include <benchmark/benchmark.h>

#include <Eigen/Dense>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "myo-core/src/AnalysisConfig.hpp"
#include "myo-core/src/DataTypes/Trace.hpp"
#include "myo-core/src/Detection/BaselineEstimator.hpp"
#include "myo-core/src/Detection/PeakDetector.hpp"
#include "myo-core/src/Pipeline/BatchAnalyzer.hpp"
#include "myo-core/src/Pipeline/RecordingAnalyzer.hpp"

using namespace myo_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

constexpr double kSampleRate = 250.0;

// Phasic contractions every ~2 s on a 0.1 mN tone, with amplitude jitter and
// measurement noise
Trace generateRecording(double duration, std::mt19937& rng)
{
  auto const count = static_cast<Eigen::Index>(std::llround(duration * kSampleRate));
  Eigen::VectorXd time{count};
  Eigen::VectorXd force = Eigen::VectorXd::Constant(count, 0.1);

  std::normal_distribution<double> noise{0.0, 0.005};
  std::uniform_real_distribution<double> amplitude{0.08, 0.4};
  std::uniform_real_distribution<double> spacing{1.5, 2.5};

  for (Eigen::Index i = 0; i < count; ++i)
  {
    time[i] = static_cast<double>(i) / kSampleRate;
  }

  for (double peak = 1.0; peak < duration; peak += spacing(rng))
  {
    double const a = amplitude(rng);
    for (Eigen::Index i = 0; i < count; ++i)
    {
      double const shape = 1.0 - std::abs(time[i] - peak) / 0.4;
      if (shape > 0.0)
      {
        force[i] += a * shape;
      }
    }
  }

  for (Eigen::Index i = 0; i < count; ++i)
  {
    force[i] += noise(rng);
  }
  return Trace{time, force};
}

}  // namespace

// ============================================================================
// Benchmarks: Detection Stages
// ============================================================================

/**
 * @brief Baseline estimation over a full 150 s analysis window
 *
 * @ticket 0002_baseline_estimation
 */
static void BM_BaselineEstimator_Window(benchmark::State& state)
{
  std::mt19937 rng{42};
  Trace const trace = generateRecording(150.0, rng);

  for (auto _ : state)
  {
    double baseline = BaselineEstimator::estimate(trace.view());
    benchmark::DoNotOptimize(baseline);
  }
}
BENCHMARK(BM_BaselineEstimator_Window);

/**
 * @brief Peak detection scaling with window length
 *
 * @ticket 0003_peak_detection
 */
static void BM_PeakDetector_Detect(benchmark::State& state)
{
  std::mt19937 rng{42};
  Trace const trace = generateRecording(static_cast<double>(state.range(0)), rng);
  PeakDetector const detector{AnalysisConfig{}};
  double const baseline = BaselineEstimator::estimate(trace.view());

  for (auto _ : state)
  {
    auto peaks = detector.detect(trace.view(), baseline);
    benchmark::DoNotOptimize(peaks);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_PeakDetector_Detect)
  ->Args({10})
  ->Args({60})
  ->Args({150})
  ->Args({600})
  ->Complexity();

// ============================================================================
// Benchmarks: Full Analysis
// ============================================================================

/**
 * @brief One recording: full window plus 15 bins
 *
 * @ticket 0009_recording_analysis
 */
static void BM_RecordingAnalyzer_Analyze(benchmark::State& state)
{
  std::mt19937 rng{42};
  Trace const trace = generateRecording(180.0, rng);
  RecordingAnalyzer const analyzer{AnalysisConfig{}};

  for (auto _ : state)
  {
    auto result = analyzer.analyze(trace, "bench");
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_RecordingAnalyzer_Analyze);

/**
 * @brief Batch of 16 recordings across worker counts
 *
 * @ticket 0010_batch_analysis
 */
static void BM_BatchAnalyzer_Workers(benchmark::State& state)
{
  std::mt19937 rng{42};
  std::vector<NamedTrace> recordings;
  for (int i = 0; i < 16; ++i)
  {
    recordings.push_back(
      NamedTrace{"recording_" + std::to_string(i), generateRecording(150.0, rng)});
  }

  BatchAnalyzer::Config config;
  config.workerCount = static_cast<std::size_t>(state.range(0));
  auto logger = std::make_shared<spdlog::logger>(
    "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
  BatchAnalyzer const analyzer{AnalysisConfig{}, config, logger};

  for (auto _ : state)
  {
    auto batch = analyzer.analyze(recordings);
    benchmark::DoNotOptimize(batch);
  }
}
BENCHMARK(BM_BatchAnalyzer_Workers)->Args({1})->Args({2})->Args({4})->Args({8});

BENCHMARK_MAIN();
