#include "FeatureExtractor.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>
#include <tuple>
#include <vector>

namespace {

double toDb(double amplitude) {
  return 20.0 * std::log10(std::max(amplitude, 1e-10));
}

// Vertex offset of the parabola through (-1,y0) (0,y1) (1,y2); 0 when not a peak.
double parabolicOffset(double y0, double y1, double y2) {
  const double denom = y0 - 2.0 * y1 + y2;
  if (denom >= 0.0) return 0.0;
  return std::clamp(0.5 * (y0 - y2) / denom, -0.5, 0.5);
}

double meanClippedDb(const std::vector<double>& db, double rangeDb) {
  if (db.empty()) return std::nan("");
  const double top = *std::max_element(db.begin(), db.end());
  const double floorDb = top - rangeDb;
  double acc = 0.0;
  for (double v : db) acc += std::max(v, floorDb);
  return acc / double(db.size());
}

} // namespace

FeatureExtractor::FeatureExtractor(const AnalysisConfig& config) : _config(config) {}

double FeatureExtractor::silenceAmplitude() const {
  return std::pow(10.0, _config.silenceThresholdDb / 20.0);
}

double FeatureExtractor::peakAbs(const AudioSignal& signal) {
  float peak = 0.0f;
  for (const QVector<float>& ch : signal.channels())
    for (float s : ch) peak = std::max(peak, std::abs(s));
  return peak;
}

bool FeatureExtractor::isSilent(const AudioSignal& signal) const {
  return peakAbs(signal) < silenceAmplitude();
}

std::pair<ScalarFeature, ScalarFeature> FeatureExtractor::amplitude(const AudioSignal& signal) const {
  if (signal.isEmpty()) {
    const ScalarFeature u = ScalarFeature::unavailable("signal has no samples");
    return {u, u};
  }

  double peak = 0.0;
  double sumAbs = 0.0;
  qint64 count = 0;
  for (const QVector<float>& ch : signal.channels()) {
    for (float s : ch) {
      const double a = std::abs(double(s));
      peak = std::max(peak, a);
      sumAbs += a;
    }
    count += ch.size();
  }
  return { finiteOrUnavailable(peak, "max amplitude"),
           finiteOrUnavailable(sumAbs / double(count), "average amplitude") };
}

ScalarFeature FeatureExtractor::averageLoudness(const AudioSignal& signal) const {
  const QVector<float>& x = signal.mono();
  const int n = x.size();
  if (n == 0) return ScalarFeature::unavailable("signal has no samples");

  const int N = _config.frameSize;
  const int hop = std::max(1, _config.hopSize);

  auto frameDb = [&](int start, int len) {
    double ss = 0.0;
    for (int i = start; i < start + len; ++i) ss += double(x[i]) * x[i];
    return 10.0 * std::log10(std::max(ss / len, 1e-10));
  };

  std::vector<double> db;
  if (n < N) {
    db.push_back(frameDb(0, n));
  } else {
    db.reserve(size_t((n - N) / hop + 1));
    for (int start = 0; start + N <= n; start += hop) db.push_back(frameDb(start, N));
  }
  return finiteOrUnavailable(meanClippedDb(db, _config.loudnessRangeDb), "loudness");
}

double FeatureExtractor::aWeightingGain(double hz) {
  if (hz <= 0.0) return 0.0;
  const double f2 = hz * hz;
  const double num = 12194.0 * 12194.0 * f2 * f2;
  const double den = (f2 + 20.6 * 20.6)
                   * std::sqrt((f2 + 107.7 * 107.7) * (f2 + 737.9 * 737.9))
                   * (f2 + 12194.0 * 12194.0);
  return num / den * std::pow(10.0, 2.0 / 20.0);   // +2.0 dB normalises 1 kHz to 0 dB
}

ScalarFeature FeatureExtractor::weightedLoudness(const SpectralFrameSet& set) const {
  if (set.isEmpty()) return ScalarFeature::unavailable("no spectral frames");

  const int N = set.frameSize;
  const int bins = set.binCount();

  // Parseval: sum|X|^2 over the full spectrum = N * sum (x w)^2
  double sumW2 = 0.0;
  for (int n = 0; n < N; ++n) {
    const double w = 0.5 * (1.0 - std::cos(2.0 * M_PI * n / (N - 1)));
    sumW2 += w * w;
  }
  const double norm = 1.0 / (double(N) * sumW2);

  std::vector<double> weight(bins);
  for (int k = 0; k < bins; ++k) {
    const double g = aWeightingGain(set.frequencyOf(k));
    const double twoSided = (k == 0 || k == bins - 1) ? 1.0 : 2.0;
    weight[k] = twoSided * g * g * norm;
  }

  std::vector<double> db;
  db.reserve(set.frames.size());
  for (const SpectralFrame& f : set.frames) {
    double p = 0.0;
    for (int k = 0; k < bins; ++k) p += double(f.magnitudes[k]) * f.magnitudes[k] * weight[k];
    db.push_back(10.0 * std::log10(std::max(p, 1e-10)));
  }
  return finiteOrUnavailable(meanClippedDb(db, _config.loudnessRangeDb), "A-weighted loudness");
}

std::pair<ScalarFeature, ScalarFeature> FeatureExtractor::frequencyBounds(const SpectralAnalysis& spectral) const {
  const QVector<float>& avg = spectral.averageMagnitude;
  const int bins = avg.size();
  if (bins < 3) {
    const ScalarFeature u = ScalarFeature::unavailable("spectrum has too few bins");
    return {u, u};
  }

  const double scale = spectral.frames.amplitudeScale();
  std::vector<double> db(bins);
  double peakDb = -1e9;
  for (int k = 0; k < bins; ++k) {
    db[k] = toDb(double(avg[k]) * scale);
    if (k >= 1) peakDb = std::max(peakDb, db[k]);   // DC excluded
  }

  if (peakDb < _config.silenceThresholdDb) {
    const ScalarFeature u = ScalarFeature::unavailable(
        QString("no spectral energy above %1 dBFS").arg(_config.silenceThresholdDb));
    return {u, u};
  }

  const double threshold = peakDb - _config.noiseFloorDb;
  int lo = -1, hi = -1;
  for (int k = 1; k < bins; ++k) {
    if (db[k] >= threshold) {
      if (lo < 0) lo = k;
      hi = k;
    }
  }
  if (lo < 0) {
    const ScalarFeature u = ScalarFeature::unavailable("no bin above the noise floor");
    return {u, u};
  }

  // Walk onto the peak each edge bin belongs to.
  while (lo + 1 < bins && db[lo + 1] > db[lo]) ++lo;
  while (hi - 1 >= 1 && db[hi - 1] > db[hi]) --hi;

  auto refine = [&](int k) {
    double delta = 0.0;
    if (k - 1 >= 0 && k + 1 < bins) delta = parabolicOffset(db[k - 1], db[k], db[k + 1]);
    return (k + delta) * spectral.frames.binHz();
  };

  const double fLo = refine(lo);
  const double fHi = refine(hi);
  qCDebug(lcFeatures) << "frequency bounds |" << fLo << "-" << fHi << "Hz | peak" << peakDb << "dB";
  return { finiteOrUnavailable(fLo, "min frequency"), finiteOrUnavailable(fHi, "max frequency") };
}

QVector<float> FeatureExtractor::onsetEnvelope(const SpectralFrameSet& set) const {
  const int T = set.frames.size();
  const int bins = set.binCount();
  QVector<float> onset(T, 0.0f);
  if (T < 2) return onset;

  const double scale = set.amplitudeScale();
  float peakMag = 0.0f;
  for (const SpectralFrame& f : set.frames)
    for (float m : f.magnitudes) peakMag = std::max(peakMag, m);
  const double floorDb = toDb(peakMag * scale) - _config.loudnessRangeDb;

  auto frameDb = [&](const SpectralFrame& f, std::vector<double>& out) {
    for (int k = 0; k < bins; ++k) out[k] = std::max(floorDb, toDb(f.magnitudes[k] * scale));
  };

  // Spectral flux, positive differences only
  std::vector<double> prev(bins), cur(bins);
  frameDb(set.frames[0], prev);
  std::vector<double> raw(T, 0.0);
  for (int t = 1; t < T; ++t) {
    frameDb(set.frames[t], cur);
    double flux = 0.0;
    for (int k = 0; k < bins; ++k) {
      const double diff = cur[k] - prev[k];
      if (diff > 0) flux += diff;
    }
    raw[t] = flux / bins;
    prev.swap(cur);
  }

  // [1/4 1/2 1/4], edges replicated
  for (int t = 0; t < T; ++t) {
    const double a = raw[std::max(0, t - 1)];
    const double b = raw[t];
    const double c = raw[std::min(T - 1, t + 1)];
    onset[t] = float(0.25 * a + 0.5 * b + 0.25 * c);
  }
  return onset;
}

ScalarFeature FeatureExtractor::tempo(const AudioSignal& signal, const SpectralFrameSet& set) const {
  if (signal.durationSeconds() < _config.minTempoSeconds)
    return ScalarFeature::unavailable(QString("signal shorter than %1 s").arg(_config.minTempoSeconds));
  if (isSilent(signal))
    return ScalarFeature::unavailable("signal is silent");

  const QVector<float> onset = onsetEnvelope(set);
  const int n = onset.size();
  const double frameRate = 1.0 / set.secondsPerFrame();

  double mean = 0.0;
  for (float v : onset) mean += v;
  mean /= std::max(1, n);
  std::vector<double> e(n);
  double energy = 0.0;
  for (int t = 0; t < n; ++t) { e[t] = onset[t] - mean; energy += e[t] * e[t]; }
  if (energy <= 1e-12) return ScalarFeature::unavailable("no onsets detected");

  const int lagMin = std::max(1, int(std::floor(60.0 * frameRate / _config.maxTempoBpm)));
  const int lagMax = std::min(n - 2, int(std::ceil(60.0 * frameRate / _config.minTempoBpm)));
  if (lagMax <= lagMin) return ScalarFeature::unavailable("too few frames for the tempo range");

  // Unbiased autocorrelation around the search range (one extra lag each side for refinement).
  std::vector<double> r(lagMax + 2, 0.0);
  for (int lag = std::max(1, lagMin - 1); lag <= lagMax + 1; ++lag) {
    double acc = 0.0;
    for (int t = 0; t + lag < n; ++t) acc += e[t] * e[t + lag];
    r[lag] = acc / double(n - lag);
  }

  // Log-normal prior around the preferred tempo, one octave spread.
  int best = -1;
  double bestScore = 0.0;
  for (int lag = lagMin; lag <= lagMax; ++lag) {
    if (r[lag] <= 0.0) continue;
    const double bpm = 60.0 * frameRate / lag;
    const double oct = std::log2(bpm / _config.tempoPriorBpm);
    const double score = std::exp(-0.5 * oct * oct) * r[lag];
    if (score > bestScore) { bestScore = score; best = lag; }
  }
  if (best < 0) return ScalarFeature::unavailable("no periodic onset pattern");

  const double delta = (best - 1 >= 1) ? parabolicOffset(r[best - 1], r[best], r[best + 1]) : 0.0;
  const double bpm = 60.0 * frameRate / (best + delta);
  qCDebug(lcFeatures) << "tempo | lag" << best << "+" << delta << "| bpm" << bpm;
  return finiteOrUnavailable(bpm, "tempo");
}

ChromaFeature FeatureExtractor::chroma(const AudioSignal& signal, const SpectralFrameSet& set) const {
  if (isSilent(signal)) return ChromaFeature::unavailable("signal is silent");
  if (set.isEmpty()) return ChromaFeature::unavailable("no spectral frames");

  // Map FFT bins to pitch classes, A4 = 440 Hz, C = 0
  const int bins = set.binCount();
  const double fMax = std::min(_config.chromaMaxHz, 0.5 * set.sampleRate);
  std::vector<int> pitchClass(bins, -1);
  bool any = false;
  for (int k = 1; k < bins; ++k) {
    const double f = set.frequencyOf(k);
    if (f < _config.chromaMinHz || f > fMax) continue;
    const long midi = std::lround(69.0 + 12.0 * std::log2(f / 440.0));
    pitchClass[k] = int(((midi % 12) + 12) % 12);
    any = true;
  }
  if (!any) return ChromaFeature::unavailable("no FFT bins inside the chroma range");

  Chroma sum{};
  int voiced = 0;
  for (const SpectralFrame& f : set.frames) {
    Chroma c{};
    for (int k = 1; k < bins; ++k) {
      if (pitchClass[k] < 0) continue;
      c[pitchClass[k]] += double(f.magnitudes[k]) * f.magnitudes[k];
    }
    const double mx = *std::max_element(c.begin(), c.end());
    if (mx <= 0.0) continue;      // silent frame contributes zeros
    for (int i = 0; i < 12; ++i) sum[i] += c[i] / mx;
    ++voiced;
  }
  if (voiced == 0) return ChromaFeature::unavailable("no tonal energy in the chroma range");

  Chroma out{};
  const double inv = 1.0 / set.frames.size();
  for (int i = 0; i < 12; ++i) out[i] = sum[i] * inv;
  return ChromaFeature::available(out);
}

bool FeatureExtractor::extractSignalFeatures(const AudioSignal& signal, SignalFeatures& s,
                                             const CancelFn& cancelled) const
{
  auto stop = [&] { return cancelled && cancelled(); };
  s.durationSeconds   = signal.durationSeconds();
  s.sampleRate        = signal.nativeSampleRate();
  s.samplingFrequency = signal.sampleRate();
  s.channels          = signal.channelCount();
  if (stop()) return false;
  std::tie(s.maxAmplitude, s.averageAmplitude) = amplitude(signal);
  if (stop()) return false;
  if (_config.loudnessWeighting == LoudnessWeighting::Flat) {
    s.averageLoudnessDb = averageLoudness(signal);
    if (stop()) return false;
  }
  return true;
}

bool FeatureExtractor::extractSpectralFeatures(const AudioSignal& signal, const SpectralAnalysis& spectral,
                                               SpectralFeatures& f, const CancelFn& cancelled) const
{
  auto stop = [&] { return cancelled && cancelled(); };
  std::tie(f.minFrequencyHz, f.maxFrequencyHz) = frequencyBounds(spectral);
  if (stop()) return false;
  f.tempoBpm = tempo(signal, spectral.frames);
  if (stop()) return false;
  f.chroma = chroma(signal, spectral.frames);
  if (stop()) return false;
  if (_config.loudnessWeighting == LoudnessWeighting::AWeighted) {
    f.weightedLoudnessDb = weightedLoudness(spectral.frames);
    if (stop()) return false;
  }
  return true;
}
