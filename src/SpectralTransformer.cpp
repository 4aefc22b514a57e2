#include "SpectralTransformer.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>
#include <cstring>

SpectralTransformer::SpectralTransformer(int frameSize, int hopSize, int envelopeOrder)
  : _N(frameSize), _hop(std::max(1, hopSize)), _envelopeOrder(std::max(0, envelopeOrder))
{
  _cfg = kiss_fftr_alloc(_N, 0, nullptr, nullptr);
  if (!_cfg) {
    qCWarning(lcDsp) << "kiss_fftr_alloc failed for N =" << _N;
    return;
  }
  _window.assign(_N, 0.0f);
  _frame.assign(_N, 0.0f);
  _spec.assign(_N/2 + 1, kiss_fft_cpx{0,0});
  computeWindow();
}

SpectralTransformer::~SpectralTransformer() {
  cleanup();
}

void SpectralTransformer::cleanup() {
  if (_cfg) {
    kiss_fftr_free(_cfg);
    _cfg = nullptr;
  }
}

void SpectralTransformer::computeWindow() {
  // Hann window
  _windowSum = 0.0;
  for (int n = 0; n < _N; ++n) {
    _window[n] = 0.5f * (1.0f - std::cos(2.0f * float(M_PI) * n / (_N - 1)));
    _windowSum += _window[n];
  }
}

SpectralFrameSet SpectralTransformer::transform(const QVector<float>& mono, int sampleRate) {
  SpectralFrameSet set;
  set.sampleRate = sampleRate;
  set.frameSize = _N;
  set.hopSize = _hop;
  set.windowSum = _windowSum;
  if (!_cfg || mono.isEmpty() || sampleRate <= 0) return set;

  const int n = mono.size();
  const int frameCount = (n + _hop - 1) / _hop;
  const int bins = _N/2 + 1;
  set.frames.reserve(frameCount);

  for (int f = 0; f < frameCount; ++f) {
    const int start = f * _hop;
    const int avail = std::min(_N, n - start);

    // 1) Copy, zero-pad the tail
    std::memcpy(_frame.data(), mono.constData() + start, size_t(avail) * sizeof(float));
    if (avail < _N) std::fill(_frame.begin() + avail, _frame.end(), 0.0f);

    // 2) Window
    for (int i = 0; i < _N; ++i) _frame[i] *= _window[i];

    // 3) FFT
    kiss_fftr(_cfg, _frame.data(), _spec.data());

    // 4) Magnitudes
    SpectralFrame frame;
    frame.startTime = double(start) / sampleRate;
    frame.magnitudes.resize(bins);
    for (int k = 0; k < bins; ++k) {
      frame.magnitudes[k] = std::hypot(_spec[k].r, _spec[k].i);
    }
    set.frames.append(frame);
  }

  qCDebug(lcDsp) << "STFT |" << frameCount << "frames | N =" << _N << "| hop =" << _hop;
  return set;
}

QVector<float> SpectralTransformer::averageSpectrum(const SpectralFrameSet& set) {
  const int bins = set.binCount();
  QVector<float> avg(bins, 0.0f);
  if (set.frames.isEmpty()) return avg;

  std::vector<double> acc(bins, 0.0);
  for (const SpectralFrame& f : set.frames) {
    for (int k = 0; k < bins; ++k) acc[k] += f.magnitudes[k];
  }
  const double inv = 1.0 / set.frames.size();
  for (int k = 0; k < bins; ++k) avg[k] = float(acc[k] * inv);
  return avg;
}

QVector<float> SpectralTransformer::smoothEnvelope(const QVector<float>& averageMagnitude,
                                                   double amplitudeScale, int order)
{
  const int bins = averageMagnitude.size();
  QVector<float> env(bins, 0.0f);
  if (bins == 0) return env;

  std::vector<double> db(bins);
  for (int k = 0; k < bins; ++k) {
    const double a = std::max(double(averageMagnitude[k]) * amplitudeScale, 1e-10);
    db[k] = 20.0 * std::log10(a);
  }

  // Centred moving average, window shrinks at the edges. Prefix sums keep it O(n).
  std::vector<double> prefix(bins + 1, 0.0);
  for (int k = 0; k < bins; ++k) prefix[k + 1] = prefix[k] + db[k];
  for (int k = 0; k < bins; ++k) {
    const int a = std::max(0, k - order);
    const int z = std::min(bins - 1, k + order);
    env[k] = float((prefix[z + 1] - prefix[a]) / double(z - a + 1));
  }
  return env;
}

SpectralAnalysis SpectralTransformer::analyze(const QVector<float>& mono, int sampleRate) {
  SpectralAnalysis out;
  out.frames = transform(mono, sampleRate);
  out.averageMagnitude = averageSpectrum(out.frames);
  out.envelopeDb = smoothEnvelope(out.averageMagnitude, out.frames.amplitudeScale(), _envelopeOrder);
  out.envelopeOrder = _envelopeOrder;
  return out;
}
