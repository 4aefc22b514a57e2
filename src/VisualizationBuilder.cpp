#include "VisualizationBuilder.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

VisualizationData VisualizationBuilder::build(const AudioSignal& signal, const SpectralAnalysis& spectral) {
  VisualizationData v;
  const SpectralFrameSet& set = spectral.frames;

  // Waveform (implicitly shared with the signal)
  v.waveform.samples = signal.mono();
  v.waveform.sampleRate = signal.sampleRate();
  v.waveform.durationSeconds = signal.durationSeconds();

  // Spectrogram
  const double scale = set.amplitudeScale();
  v.spectrogram.secondsPerColumn = set.secondsPerFrame();
  v.spectrogram.binHz = set.binHz();
  v.spectrogram.amplitudeScale = scale;
  v.spectrogram.columns.reserve(set.frames.size());
  v.spectrogram.columnTimes.reserve(set.frames.size());
  v.peakLevelDb.reserve(set.frames.size());
  for (const SpectralFrame& f : set.frames) {
    v.spectrogram.columns.append(f.magnitudes);
    v.spectrogram.columnTimes.append(f.startTime);
    float mx = 0.0f;
    for (float m : f.magnitudes) mx = std::max(mx, m);
    v.peakLevelDb.append(float(20.0 * std::log10(std::max(mx * scale, 1e-10))));
  }

  // Frequency axis shared by spectrum and envelope
  const int bins = spectral.averageMagnitude.size();
  QVector<float> freqs(bins);
  for (int k = 0; k < bins; ++k) freqs[k] = float(set.frequencyOf(k));

  v.spectrum.frequencies = freqs;
  v.spectrum.magnitudes.resize(bins);
  for (int k = 0; k < bins; ++k) v.spectrum.magnitudes[k] = float(spectral.averageMagnitude[k] * scale);

  v.envelope.frequencies = freqs;
  v.envelope.levelsDb = spectral.envelopeDb;
  v.envelope.order = spectral.envelopeOrder;

  qCDebug(lcPipeline) << "visualization |" << v.spectrogram.columnCount() << "columns x"
                      << v.spectrogram.binCount() << "bins";
  return v;
}
