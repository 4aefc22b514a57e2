#pragma once
#include <QString>
#include <array>
#include <cmath>
#include <optional>

// A computed value, or the reason it could not be computed.
template <typename T>
struct Feature {
  std::optional<T> value;
  QString reason;

  static Feature available(const T& v) { Feature f; f.value = v; return f; }
  static Feature unavailable(const QString& why) { Feature f; f.reason = why; return f; }

  bool isAvailable() const { return value.has_value(); }
  const T& operator*() const { return *value; }

  bool operator==(const Feature& o) const { return value == o.value && reason == o.reason; }
  bool operator!=(const Feature& o) const { return !(*this == o); }
};

using Chroma = std::array<double, 12>;
using ScalarFeature = Feature<double>;
using ChromaFeature = Feature<Chroma>;

// Wraps a scalar, refusing NaN/inf.
inline ScalarFeature finiteOrUnavailable(double v, const QString& what) {
  if (!std::isfinite(v)) return ScalarFeature::unavailable(QString("%1 is not finite").arg(what));
  return ScalarFeature::available(v);
}

// Results of the time-domain pass.
struct SignalFeatures {
  double durationSeconds = 0.0;
  int sampleRate = 0;              // native
  int samplingFrequency = 0;       // analysis
  int channels = 0;
  ScalarFeature maxAmplitude;
  ScalarFeature averageAmplitude;
  ScalarFeature averageLoudnessDb;
};

// Results that need the spectral frames.
struct SpectralFeatures {
  ScalarFeature minFrequencyHz;
  ScalarFeature maxFrequencyHz;
  ScalarFeature tempoBpm;
  ChromaFeature chroma;
  std::optional<ScalarFeature> weightedLoudnessDb;   // set when A-weighting is configured
};

struct FeatureReport {
  double durationSeconds = 0.0;
  int sampleRate = 0;
  int samplingFrequency = 0;
  int channels = 0;
  ScalarFeature maxAmplitude;
  ScalarFeature averageAmplitude;
  ScalarFeature minFrequencyHz;
  ScalarFeature maxFrequencyHz;
  ScalarFeature tempoBpm;
  ScalarFeature averageLoudnessDb;
  ChromaFeature chroma;

  static FeatureReport assemble(const SignalFeatures& s, const SpectralFeatures& f);

  static const char* const kChromaNotes[12];

  bool operator==(const FeatureReport& o) const;
  bool operator!=(const FeatureReport& o) const { return !(*this == o); }
};
