#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "FeatureExtractor.h"
#include "TestSignals.h"

namespace {

const int kRate = 22050;

AnalysisConfig testConfig() {
  AnalysisConfig c;
  c.analysisSampleRate = 0;
  return c;
}

SpectralAnalysis spectralOf(const AudioSignal& s, const AnalysisConfig& c = testConfig()) {
  SpectralTransformer t(c.frameSize, c.hopSize, c.envelopeOrder);
  return t.analyze(s.mono(), s.sampleRate());
}

FeatureReport extractAll(const FeatureExtractor& fx, const AudioSignal& s, const SpectralAnalysis& a) {
  SignalFeatures sf;
  SpectralFeatures spf;
  EXPECT_TRUE(fx.extractSignalFeatures(s, sf));
  EXPECT_TRUE(fx.extractSpectralFeatures(s, a, spf));
  return FeatureReport::assemble(sf, spf);
}

} // namespace

TEST(FeatureExtractor, DurationIsFramesOverRate) {
  const AudioSignal s = monoSignal(makeSilence(3.0, kRate), kRate);
  const FeatureReport r = extractAll(FeatureExtractor(testConfig()), s, spectralOf(s));
  EXPECT_DOUBLE_EQ(r.durationSeconds, 3.0);
  EXPECT_EQ(r.sampleRate, kRate);
  EXPECT_EQ(r.samplingFrequency, kRate);
  EXPECT_EQ(r.channels, 1);
}

TEST(FeatureExtractor, SineAmplitudeStatistics) {
  const AudioSignal s = monoSignal(makeSine(440.0, 2.0, kRate, 0.5f), kRate);
  const auto amp = FeatureExtractor(testConfig()).amplitude(s);
  ASSERT_TRUE(amp.first.isAvailable());
  ASSERT_TRUE(amp.second.isAvailable());
  EXPECT_NEAR(*amp.first, 0.5, 1e-3);
  EXPECT_NEAR(*amp.second, 0.5 * 2.0 / M_PI, 2e-3);
}

TEST(FeatureExtractor, AverageAmplitudeNeverExceedsMax) {
  const QVector<float> l = makeNoise(1.0, kRate, 0.9f, 7);
  const QVector<float> r = makeNoise(1.0, kRate, 0.1f, 9);
  const AudioSignal s(QVector<QVector<float>>{l, r}, kRate, kRate);
  const auto amp = FeatureExtractor(testConfig()).amplitude(s);
  EXPECT_GE(*amp.second, 0.0);
  EXPECT_LE(*amp.second, *amp.first);
  EXPECT_LE(*amp.first, 0.9 + 1e-6);
}

TEST(FeatureExtractor, SineFrequencyBoundsLandOnTheTone) {
  const AudioSignal s = monoSignal(makeSine(1000.0, 2.0, kRate), kRate);
  const SpectralAnalysis a = spectralOf(s);
  const auto bounds = FeatureExtractor(testConfig()).frequencyBounds(a);
  ASSERT_TRUE(bounds.first.isAvailable());
  ASSERT_TRUE(bounds.second.isAvailable());
  const double bin = a.frames.binHz();
  EXPECT_NEAR(*bounds.first, 1000.0, bin);
  EXPECT_NEAR(*bounds.second, 1000.0, bin);
  EXPECT_LE(*bounds.first, *bounds.second);
}

TEST(FeatureExtractor, TwoTonesSpanTheBounds) {
  const AudioSignal s = monoSignal(mix(makeSine(300.0, 2.0, kRate, 0.3f),
                                       makeSine(3000.0, 2.0, kRate, 0.3f)), kRate);
  const SpectralAnalysis a = spectralOf(s);
  const auto bounds = FeatureExtractor(testConfig()).frequencyBounds(a);
  ASSERT_TRUE(bounds.first.isAvailable());
  EXPECT_NEAR(*bounds.first, 300.0, a.frames.binHz());
  EXPECT_NEAR(*bounds.second, 3000.0, a.frames.binHz());
}

TEST(FeatureExtractor, SilenceLeavesSpectralFeaturesUnavailable) {
  const AudioSignal s = monoSignal(makeSilence(6.0, kRate), kRate);
  const FeatureReport r = extractAll(FeatureExtractor(testConfig()), s, spectralOf(s));

  EXPECT_FALSE(r.tempoBpm.isAvailable());
  EXPECT_FALSE(r.minFrequencyHz.isAvailable());
  EXPECT_FALSE(r.maxFrequencyHz.isAvailable());
  EXPECT_FALSE(r.chroma.isAvailable());
  EXPECT_FALSE(r.tempoBpm.reason.isEmpty());
  EXPECT_FALSE(r.minFrequencyHz.reason.isEmpty());

  // Still reported, just at the floor
  ASSERT_TRUE(r.averageLoudnessDb.isAvailable());
  EXPECT_TRUE(std::isfinite(*r.averageLoudnessDb));
  ASSERT_TRUE(r.maxAmplitude.isAvailable());
  EXPECT_EQ(*r.maxAmplitude, 0.0);
}

TEST(FeatureExtractor, NearSilentNoiseCountsAsSilence) {
  const AudioSignal s = monoSignal(makeNoise(6.0, kRate, 1e-6f), kRate);
  const FeatureReport r = extractAll(FeatureExtractor(testConfig()), s, spectralOf(s));
  EXPECT_FALSE(r.tempoBpm.isAvailable());
  EXPECT_FALSE(r.minFrequencyHz.isAvailable());
  EXPECT_FALSE(r.maxFrequencyHz.isAvailable());
}

TEST(FeatureExtractor, ShortSignalHasNoTempo) {
  const AudioSignal s = monoSignal(makeClickTrack(120.0, 2.0, kRate), kRate);
  const ScalarFeature t = FeatureExtractor(testConfig()).tempo(s, spectralOf(s).frames);
  ASSERT_FALSE(t.isAvailable());
  EXPECT_TRUE(t.reason.contains("shorter"));
}

TEST(FeatureExtractor, ClickTrackTempo) {
  const AudioSignal s = monoSignal(makeClickTrack(120.0, 8.0, kRate), kRate);
  const ScalarFeature t = FeatureExtractor(testConfig()).tempo(s, spectralOf(s).frames);
  ASSERT_TRUE(t.isAvailable()) << t.reason.toStdString();
  EXPECT_NEAR(*t, 120.0, 4.0);
}

TEST(FeatureExtractor, SteadyToneHasNoOnsets) {
  const AudioSignal s = monoSignal(makeSine(440.0, 6.0, kRate), kRate);
  const QVector<float> onset = FeatureExtractor(testConfig()).onsetEnvelope(spectralOf(s).frames);
  // Only the zero-padded tail moves; the body is flat.
  for (int t = 2; t < onset.size() - 6; ++t) EXPECT_LT(onset[t], 0.05f);
}

TEST(FeatureExtractor, SineLoudness) {
  const AudioSignal s = monoSignal(makeSine(440.0, 2.0, kRate, 0.5f), kRate);
  const ScalarFeature l = FeatureExtractor(testConfig()).averageLoudness(s);
  ASSERT_TRUE(l.isAvailable());
  EXPECT_NEAR(*l, 10.0 * std::log10(0.125), 0.2);
}

TEST(FeatureExtractor, AWeightedLoudnessAtOneKilohertzMatchesFlat) {
  AnalysisConfig c = testConfig();
  c.loudnessWeighting = LoudnessWeighting::AWeighted;
  const AudioSignal s = monoSignal(makeSine(1000.0, 4.0, kRate, 0.5f), kRate);
  const FeatureReport r = extractAll(FeatureExtractor(c), s, spectralOf(s, c));
  ASSERT_TRUE(r.averageLoudnessDb.isAvailable());
  EXPECT_NEAR(*r.averageLoudnessDb, 10.0 * std::log10(0.125), 1.0);
}

TEST(FeatureExtractor, AWeightingCurve) {
  EXPECT_NEAR(FeatureExtractor::aWeightingGain(1000.0), 1.0, 0.01);
  EXPECT_NEAR(20.0 * std::log10(FeatureExtractor::aWeightingGain(100.0)), -19.1, 0.2);
  EXPECT_EQ(FeatureExtractor::aWeightingGain(0.0), 0.0);
}

TEST(FeatureExtractor, ChromaOfConcertA) {
  const AudioSignal s = monoSignal(makeSine(440.0, 2.0, kRate), kRate);
  const ChromaFeature c = FeatureExtractor(testConfig()).chroma(s, spectralOf(s).frames);
  ASSERT_TRUE(c.isAvailable());
  const Chroma& v = *c;
  EXPECT_EQ(int(std::max_element(v.begin(), v.end()) - v.begin()), 9);   // A
  EXPECT_GT(v[9], 0.95);
  for (int i = 0; i < 12; ++i) {
    EXPECT_GE(v[i], 0.0);
    if (i != 9) EXPECT_LT(v[i], 0.5);
  }
}

TEST(FeatureExtractor, CancelStopsBetweenFields) {
  const AudioSignal s = monoSignal(makeSine(440.0, 5.0, kRate), kRate);
  const SpectralAnalysis a = spectralOf(s);
  const FeatureExtractor fx(testConfig());

  int polls = 0;
  SpectralFeatures spf;
  EXPECT_FALSE(fx.extractSpectralFeatures(s, a, spf, [&] { return ++polls >= 1; }));
  EXPECT_EQ(polls, 1);
  EXPECT_TRUE(spf.maxFrequencyHz.isAvailable());
  EXPECT_FALSE(spf.tempoBpm.isAvailable());
  EXPECT_TRUE(spf.tempoBpm.reason.isEmpty());   // never computed

  polls = 0;
  SignalFeatures sf;
  EXPECT_FALSE(fx.extractSignalFeatures(s, sf, [&] { return ++polls >= 2; }));
  EXPECT_EQ(polls, 2);
  EXPECT_TRUE(sf.maxAmplitude.isAvailable());
  EXPECT_FALSE(sf.averageLoudnessDb.isAvailable());
}
