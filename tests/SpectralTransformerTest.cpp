#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "SpectralTransformer.h"
#include "TestSignals.h"

TEST(SpectralTransformer, FramesCoverTheWholeSignal) {
  SpectralTransformer t(2048, 512, 8);
  ASSERT_TRUE(t.isValid());
  const QVector<float> x = makeNoise(10000.0 / 22050.0, 22050, 0.2f);
  ASSERT_EQ(x.size(), 10000);

  const SpectralFrameSet set = t.transform(x, 22050);
  ASSERT_EQ(set.frames.size(), 20);     // ceil(10000 / 512)
  EXPECT_EQ(set.binCount(), 1025);
  for (int k = 0; k < set.frames.size(); ++k) {
    EXPECT_DOUBLE_EQ(set.frames[k].startTime, k * 512.0 / 22050.0);
    EXPECT_EQ(set.frames[k].magnitudes.size(), 1025);
  }

  const double duration = 10000.0 / 22050.0;
  const double span = set.frames.size() * set.secondsPerFrame();
  EXPECT_GE(span, duration);
  EXPECT_LT(span - duration, set.secondsPerFrame());
}

TEST(SpectralTransformer, ShortSignalStillGivesOneFrame) {
  SpectralTransformer t(2048, 512, 8);
  const SpectralFrameSet set = t.transform(makeSine(440.0, 100.0 / 22050.0, 22050), 22050);
  EXPECT_EQ(set.frames.size(), 1);
}

TEST(SpectralTransformer, EmptyInputGivesNoFrames) {
  SpectralTransformer t(1024, 256, 4);
  const SpectralAnalysis a = t.analyze(QVector<float>(), 22050);
  EXPECT_TRUE(a.frames.isEmpty());
  EXPECT_EQ(a.averageMagnitude.size(), 513);
}

TEST(SpectralTransformer, BinCentredSinePeaksAtItsBin) {
  const int sr = 22050, N = 2048;
  const double hz = 40.0 * sr / N;
  SpectralTransformer t(N, 512, 8);
  const SpectralAnalysis a = t.analyze(makeSine(hz, 4.0, sr, 0.5f), sr);

  const auto peak = std::max_element(a.averageMagnitude.begin() + 1, a.averageMagnitude.end());
  EXPECT_EQ(int(peak - a.averageMagnitude.begin()), 40);
  // amplitude scaling recovers the sine amplitude (tail frames are zero padded)
  EXPECT_NEAR(*peak * a.frames.amplitudeScale(), 0.5, 0.05);
  EXPECT_NEAR(a.frames.frequencyOf(40), hz, 1e-9);
}

TEST(SpectralTransformer, EnvelopeOfFlatCurveIsFlat) {
  const QVector<float> flat(300, 1.0f);
  const QVector<float> env = SpectralTransformer::smoothEnvelope(flat, 1.0, 8);
  ASSERT_EQ(env.size(), 300);
  for (float v : env) EXPECT_NEAR(v, 0.0f, 1e-4f);
}

TEST(SpectralTransformer, EnvelopeSpreadsASpikeOverItsWindow) {
  QVector<float> curve(200, 1e-6f);   // -120 dB
  curve[100] = 1.0f;                  //    0 dB
  const QVector<float> env = SpectralTransformer::smoothEnvelope(curve, 1.0, 8);
  EXPECT_NEAR(env[100], -120.0f + 120.0f / 17.0f, 1e-3f);
  EXPECT_NEAR(env[108], env[100], 1e-3f);
  EXPECT_NEAR(env[109], -120.0f, 1e-3f);
  EXPECT_NEAR(env[91], -120.0f, 1e-3f);
}

TEST(SpectralTransformer, OddFrameSizeIsRejected) {
  SpectralTransformer t(1023, 256, 4);
  EXPECT_FALSE(t.isValid());
  EXPECT_TRUE(t.transform(makeSine(440.0, 0.1, 22050), 22050).isEmpty());
}
