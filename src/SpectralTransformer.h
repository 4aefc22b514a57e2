#pragma once
#include <QVector>
#include <vector>

extern "C" {
  #include "kiss_fftr.h"
}

struct SpectralFrame {
  double startTime = 0.0;          // seconds
  QVector<float> magnitudes;       // |X_k|, k = 0..N/2
};

struct SpectralFrameSet {
  int sampleRate = 0;
  int frameSize  = 0;
  int hopSize    = 0;
  double windowSum = 0.0;          // sum of Hann coefficients
  QVector<SpectralFrame> frames;

  int binCount() const { return frameSize / 2 + 1; }
  double binHz() const { return frameSize > 0 ? double(sampleRate) / frameSize : 0.0; }
  double frequencyOf(int bin) const { return bin * binHz(); }
  double secondsPerFrame() const { return sampleRate > 0 ? double(hopSize) / sampleRate : 0.0; }
  // |X| -> amplitude of a sinusoid sitting on bin centre.
  double amplitudeScale() const { return windowSum > 0.0 ? 2.0 / windowSum : 0.0; }
  bool isEmpty() const { return frames.isEmpty(); }
};

struct SpectralAnalysis {
  SpectralFrameSet frames;
  QVector<float> averageMagnitude;  // mean |X_k| over frames (raw units)
  QVector<float> envelopeDb;        // smoothed dB curve of the amplitude-scaled average
  int envelopeOrder = 0;
};

// Short-time Fourier transform of a mono signal. Owns one kissfft plan,
// so give each thread its own instance.
class SpectralTransformer {
public:
  SpectralTransformer(int frameSize, int hopSize, int envelopeOrder);
  ~SpectralTransformer();

  SpectralTransformer(const SpectralTransformer&) = delete;
  SpectralTransformer& operator=(const SpectralTransformer&) = delete;

  bool isValid() const { return _cfg != nullptr; }

  // Frame k starts at k*hop for k in [0, ceil(n/hop)); missing samples are zero.
  SpectralFrameSet transform(const QVector<float>& mono, int sampleRate);

  // transform + aggregate + envelope
  SpectralAnalysis analyze(const QVector<float>& mono, int sampleRate);

  static QVector<float> averageSpectrum(const SpectralFrameSet& set);
  static QVector<float> smoothEnvelope(const QVector<float>& averageMagnitude, double amplitudeScale, int order);

private:
  int _N;
  int _hop;
  int _envelopeOrder;

  kiss_fftr_cfg _cfg = nullptr;
  std::vector<float> _window;
  std::vector<float> _frame;
  std::vector<kiss_fft_cpx> _spec;
  double _windowSum = 0.0;

  void computeWindow();
  void cleanup();
};
