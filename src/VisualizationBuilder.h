#pragma once
#include <QVector>
#include "AudioSignal.h"
#include "SpectralTransformer.h"

struct WaveformData {
  QVector<float> samples;          // mono mix
  int sampleRate = 0;
  double durationSeconds = 0.0;
};

struct SpectrogramData {
  QVector<QVector<float>> columns; // one |X| column per frame, shared with the frame set
  QVector<double> columnTimes;     // start time of each column (s)
  double secondsPerColumn = 0.0;
  double binHz = 0.0;
  double amplitudeScale = 0.0;     // |X| -> sinusoid amplitude

  int columnCount() const { return columns.size(); }
  int binCount() const { return columns.isEmpty() ? 0 : columns.first().size(); }
  double spanSeconds() const { return columns.size() * secondsPerColumn; }
};

struct SpectrumData {
  QVector<float> frequencies;      // Hz
  QVector<float> magnitudes;       // amplitude-scaled mean spectrum
};

struct EnvelopeData {
  QVector<float> frequencies;
  QVector<float> levelsDb;
  int order = 0;                   // moving-average half width
};

struct VisualizationData {
  WaveformData waveform;
  SpectrogramData spectrogram;
  SpectrumData spectrum;
  EnvelopeData envelope;
  QVector<float> peakLevelDb;      // strongest bin per spectrogram column
};

// Packages already-computed arrays for plotting. Never re-runs a transform.
class VisualizationBuilder {
public:
  static VisualizationData build(const AudioSignal& signal, const SpectralAnalysis& spectral);
};
