#pragma once
#include <QVector>
#include <functional>
#include <utility>
#include "AnalysisConfig.h"
#include "AudioSignal.h"
#include "FeatureReport.h"
#include "SpectralTransformer.h"

// Turns an AudioSignal (and its spectral frames) into report fields.
// Every method is independent and const, so fields can be computed one at a
// time with cancellation checks between them.
class FeatureExtractor {
public:
  explicit FeatureExtractor(const AnalysisConfig& config = AnalysisConfig());

  // ---- time domain ----
  // max |x| and mean |x| over every sample of every channel
  std::pair<ScalarFeature, ScalarFeature> amplitude(const AudioSignal& signal) const;
  // mean frame level in dBFS, frames of frameSize at hopSize
  ScalarFeature averageLoudness(const AudioSignal& signal) const;

  // ---- spectral ----
  std::pair<ScalarFeature, ScalarFeature> frequencyBounds(const SpectralAnalysis& spectral) const;
  ScalarFeature tempo(const AudioSignal& signal, const SpectralFrameSet& frames) const;
  ChromaFeature chroma(const AudioSignal& signal, const SpectralFrameSet& frames) const;
  // A-weighted counterpart of averageLoudness(), from the STFT
  ScalarFeature weightedLoudness(const SpectralFrameSet& frames) const;

  // Positive log-spectral flux per frame, lightly smoothed.
  QVector<float> onsetEnvelope(const SpectralFrameSet& frames) const;

  // Peak below the configured silence threshold.
  bool isSilent(const AudioSignal& signal) const;

  using CancelFn = std::function<bool()>;

  // Fill the result one field at a time, polling `cancelled` between fields.
  // Return false as soon as it reports true; `out` is then incomplete.
  bool extractSignalFeatures(const AudioSignal& signal, SignalFeatures& out,
                             const CancelFn& cancelled = CancelFn()) const;
  bool extractSpectralFeatures(const AudioSignal& signal, const SpectralAnalysis& spectral,
                               SpectralFeatures& out, const CancelFn& cancelled = CancelFn()) const;

  static double peakAbs(const AudioSignal& signal);
  static double aWeightingGain(double hz);

private:
  AnalysisConfig _config;

  double silenceAmplitude() const;
};
