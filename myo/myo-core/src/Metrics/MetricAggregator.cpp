// Ticket: 0006_metric_aggregation

#include "myo-core/src/Metrics/MetricAggregator.hpp"

#include <algorithm>
#include <cstddef>

#include "myo-core/src/Detection/BoundaryResolver.hpp"
#include "myo-core/src/Utils/SignalMath.hpp"

namespace myo_core
{

namespace
{

// Collect one optional kinetic field across contractions, skipping absent values
template <typename Accessor>
std::vector<double> collect(const std::vector<const Contraction*>& contractions,
                            Accessor accessor)
{
  std::vector<double> values;
  values.reserve(contractions.size());
  for (const Contraction* contraction : contractions)
  {
    Metric const value = accessor(*contraction);
    if (value)
    {
      values.push_back(*value);
    }
  }
  return values;
}

}  // namespace

MetricAggregator::MetricAggregator(const AnalysisConfig& config)
  : config_{config}
{
  config_.validate();
}

MetricSet MetricAggregator::aggregate(
  const TraceView& view,
  double baseline,
  const std::vector<Contraction>& contractions) const
{
  MetricSet metrics{};
  std::size_t const n = contractions.size();
  double const window = view.duration();

  metrics.count = n;
  metrics.windowDuration = window;
  metrics.baselineTone = baseline;
  metrics.frequencyCpm =
    window > 0.0 ? static_cast<double>(n) * 60.0 / window : 0.0;

  metrics.traceIntegral =
    signal_math::clippedTrapezoid(view.times(), view.forces(), baseline);

  for (const auto& contraction : contractions)
  {
    metrics.totalIntegral += contraction.integral;
    metrics.totalContractionTime += contraction.duration;
    if (contraction.edgeTruncated())
    {
      ++metrics.edgeTruncatedCount;
    }
  }

  if (n > 0)
  {
    metrics.forcePerContraction =
      metrics.totalIntegral / static_cast<double>(n);
  }

  if (window > 0.0)
  {
    metrics.forcePerMinute = metrics.totalIntegral * 60.0 / window;
    metrics.dutyCyclePct = 100.0 * metrics.totalContractionTime / window;
    metrics.totalQuiescentTime =
      std::max(0.0, window - metrics.totalContractionTime);
  }

  aggregateAmplitudeAndPeriod(contractions, metrics);
  aggregateKinetics(contractions, metrics);
  aggregateTone(view, baseline, contractions, metrics);

  if (metrics.meanAmplitude)
  {
    metrics.amplitudeFrequencyProduct =
      *metrics.meanAmplitude * metrics.frequencyCpm;
    if (metrics.meanDuration)
    {
      metrics.contractionWorkIndex = *metrics.meanAmplitude *
                                     *metrics.meanDuration *
                                     metrics.frequencyCpm;
    }
  }

  raiseFlags(metrics);
  return metrics;
}

void MetricAggregator::aggregateAmplitudeAndPeriod(
  const std::vector<Contraction>& contractions,
  MetricSet& metrics) const
{
  std::vector<double> amplitudes;
  amplitudes.reserve(contractions.size());
  for (const auto& contraction : contractions)
  {
    amplitudes.push_back(contraction.amplitude);
  }
  metrics.meanAmplitude = signal_math::mean(amplitudes);
  metrics.amplitudeCv = signal_math::coefficientOfVariation(amplitudes);

  if (contractions.size() < 2)
  {
    return;
  }

  std::vector<double> periods;
  periods.reserve(contractions.size() - 1);
  for (std::size_t i = 1; i < contractions.size(); ++i)
  {
    periods.push_back(contractions[i].peak.time - contractions[i - 1].peak.time);
  }
  metrics.meanPeriod = signal_math::mean(periods);
  metrics.periodCv = signal_math::coefficientOfVariation(periods);
}

void MetricAggregator::aggregateKinetics(
  const std::vector<Contraction>& contractions,
  MetricSet& metrics) const
{
  std::vector<const Contraction*> included;
  included.reserve(contractions.size());
  for (const auto& contraction : contractions)
  {
    if (config_.excludeEdgeTruncatedKinetics && contraction.edgeTruncated())
    {
      continue;
    }
    included.push_back(&contraction);
  }

  auto meanOf = [&included](auto accessor)
  { return signal_math::mean(collect(included, accessor)); };

  metrics.meanDuration = meanOf([](const Contraction& c) -> Metric
                                { return c.duration; });
  metrics.meanRiseTime = meanOf([](const Contraction& c) -> Metric
                                { return c.riseTime; });
  metrics.meanRelaxationTime = meanOf([](const Contraction& c) -> Metric
                                      { return c.relaxationTime; });
  metrics.meanRiseFallRatio = meanOf([](const Contraction& c)
                                     { return c.riseFallRatio; });
  metrics.meanMaxRiseRate = meanOf([](const Contraction& c) -> Metric
                                   { return c.maxRiseRate; });
  metrics.meanMaxDeclineRate = meanOf([](const Contraction& c) -> Metric
                                      { return c.maxDeclineRate; });
  metrics.meanHalfMaxWidth = meanOf([](const Contraction& c)
                                    { return c.halfMaxWidth; });
  metrics.meanRiseTime10to90 = meanOf([](const Contraction& c)
                                      { return c.riseTime10to90; });
  metrics.meanRiseRate10to90 = meanOf([](const Contraction& c)
                                      { return c.riseRate10to90; });
  metrics.meanRelaxTime90to10 = meanOf([](const Contraction& c)
                                       { return c.relaxTime90to10; });
  metrics.meanRelaxRate90to10 = meanOf([](const Contraction& c)
                                       { return c.relaxRate90to10; });
}

void MetricAggregator::aggregateTone(const TraceView& view,
                                     double baseline,
                                     const std::vector<Contraction>& contractions,
                                     MetricSet& metrics) const
{
  if (metrics.windowDuration > 0.0 && baseline > 0.0)
  {
    metrics.phasicTonicRatio =
      metrics.totalIntegral / (baseline * metrics.windowDuration);
  }

  if (contractions.size() < 2)
  {
    return;
  }

  std::vector<double> gaps;
  std::vector<double> tonicTroughs;
  double quiescentSum = 0.0;
  std::size_t quiescentSamples = 0;

  for (std::size_t i = 0; i + 1 < contractions.size(); ++i)
  {
    const Contraction& current = contractions[i];
    const Contraction& next = contractions[i + 1];

    gaps.push_back(std::max(0.0, next.start.time - current.end.time));

    double troughForce = std::min(current.peak.force, next.peak.force);
    if (current.peak.index + 1 < next.peak.index)
    {
      troughForce = view.force(BoundaryResolver::troughBetween(
        view, current.peak.index, next.peak.index));
    }

    double const relaxedLevel =
      baseline + config_.boundaryFraction * current.amplitude;
    if (troughForce > relaxedLevel)
    {
      ++metrics.incompleteRelaxationCount;
      tonicTroughs.push_back(troughForce);
      continue;
    }

    for (std::size_t s = current.end.index; s < next.start.index; ++s)
    {
      quiescentSum += view.force(s);
      ++quiescentSamples;
    }
  }

  std::size_t const pairs = contractions.size() - 1;
  metrics.incompleteRelaxationPct =
    100.0 * static_cast<double>(metrics.incompleteRelaxationCount) /
    static_cast<double>(pairs);
  metrics.meanInterContractionInterval = signal_math::mean(gaps);
  metrics.meanTonicForce = signal_math::mean(tonicTroughs);
  if (quiescentSamples > 0)
  {
    metrics.meanQuiescentTone =
      quiescentSum / static_cast<double>(quiescentSamples);
  }
}

void MetricAggregator::raiseFlags(MetricSet& metrics) const
{
  metrics.flags.lowAmplitude =
    metrics.count > 0 && metrics.meanAmplitude &&
    *metrics.meanAmplitude < config_.amplitudeQualityThreshold;
  metrics.flags.lowCount = metrics.count < config_.minReliableCount;
  metrics.flags.edgeTruncated = metrics.edgeTruncatedCount > 0;
}

}  // namespace myo_core
