#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryDir>
#include <gtest/gtest.h>
#include "PlotRenderer.h"
#include "TestSignals.h"

namespace {

VisualizationData sampleVisuals() {
  const AudioSignal signal = monoSignal(mix(makeSine(440.0, 1.0, 22050), makeNoise(1.0, 22050, 0.05f)), 22050);
  SpectralTransformer t(2048, 512, 8);
  return VisualizationBuilder::build(signal, t.analyze(signal.mono(), 22050));
}

// Number of distinct colours; a blank canvas has one or two.
int colourCount(const QImage& img) {
  QSet<QRgb> seen;
  for (int y = 0; y < img.height(); ++y)
    for (int x = 0; x < img.width(); ++x) seen.insert(img.pixel(x, y));
  return seen.size();
}

} // namespace

TEST(PlotRenderer, ImagesHaveRequestedSizeAndContent) {
  const VisualizationData v = sampleVisuals();
  const PlotRenderer r(QSize(640, 320));
  const QImage images[] = {
    r.renderWaveform(v.waveform),
    r.renderSpectrogram(v.spectrogram),
    r.renderSpectrum(v.spectrum),
    r.renderEnvelope(v.envelope),
    r.renderPeakLevel(v.peakLevelDb, v.spectrogram.secondsPerColumn),
  };
  for (const QImage& img : images) {
    EXPECT_EQ(img.size(), QSize(640, 320));
    EXPECT_GT(colourCount(img), 3);
  }
}

TEST(PlotRenderer, SaveAllWritesEveryPlot) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString out = dir.filePath("plots/nested");
  QString err;
  const QStringList written = PlotRenderer().saveAll(sampleVisuals(), out, &err);
  EXPECT_TRUE(err.isEmpty()) << err.toStdString();
  ASSERT_EQ(written.size(), 5);
  for (const char* name : {"waveform.png", "spectrogram.png", "spectrum.png", "envelope.png", "peak_level.png"}) {
    const QFileInfo fi(QDir(out).filePath(name));
    EXPECT_TRUE(fi.exists()) << name;
    EXPECT_GT(fi.size(), 0) << name;
  }
}

TEST(PlotRenderer, LevelColourRunsBlueToRed) {
  EXPECT_EQ(PlotRenderer::levelColor(0.0f).hsvHue(), 240);
  EXPECT_EQ(PlotRenderer::levelColor(1.0f).hsvHue(), 0);
  EXPECT_EQ(PlotRenderer::levelColor(-3.0f), PlotRenderer::levelColor(0.0f));
  EXPECT_EQ(PlotRenderer::levelColor(7.0f), PlotRenderer::levelColor(1.0f));
}
