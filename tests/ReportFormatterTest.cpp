#include <QJsonArray>
#include <QJsonDocument>
#include <gtest/gtest.h>
#include "ReportFormatter.h"
#include "TestSignals.h"

namespace {

AnalysisReport sampleReport() {
  AnalysisReport r;
  r.file.path = "/music/song.flac";
  r.file.fileName = "song.flac";
  r.file.format = "flac";
  r.file.sizeBytes = 1234;
  r.file.lastModified = QDateTime(QDate(2024, 3, 1), QTime(12, 30, 0));
  r.file.md5 = QString("900150983cd24fb0d6963f7d28e17f72");

  r.metadata.title = QString("Song");

  FeatureReport& f = r.features;
  f.durationSeconds = 12.345;
  f.sampleRate = 44100;
  f.samplingFrequency = 22050;
  f.channels = 2;
  f.maxAmplitude = ScalarFeature::available(0.5);
  f.averageAmplitude = ScalarFeature::available(0.3183);
  f.minFrequencyHz = ScalarFeature::available(435.2);
  f.maxFrequencyHz = ScalarFeature::available(446.1);
  f.tempoBpm = ScalarFeature::unavailable("signal is silent");
  f.averageLoudnessDb = ScalarFeature::available(-9.03);
  Chroma c{};
  c[9] = 1.0;
  f.chroma = ChromaFeature::available(c);
  return r;
}

} // namespace

TEST(ReportFormatter, TextLayout) {
  const QString text = ReportFormatter::toText(sampleReport());
  const QStringList lines = text.split('\n');
  EXPECT_EQ(lines.first(), "File Name: song.flac");
  EXPECT_TRUE(lines.contains("Audio File Format: flac"));
  EXPECT_TRUE(lines.contains("Last Modified: 2024-03-01 12:30:00"));
  EXPECT_TRUE(lines.contains("File Hash: 900150983cd24fb0d6963f7d28e17f72"));
  EXPECT_TRUE(lines.contains("Artist: Unknown"));
  EXPECT_TRUE(lines.contains("Title: Song"));
  EXPECT_TRUE(lines.contains("File Duration: 12.35 seconds"));
  EXPECT_TRUE(lines.contains("Sample Rate: 44100 Hz"));
  EXPECT_TRUE(lines.contains("Sampling Frequency: 22050 Hz"));
  EXPECT_TRUE(lines.contains("Maximum Amplitude: 0.50 (scaled value)"));
  EXPECT_TRUE(lines.contains("Tempo: unavailable (signal is silent)"));
  EXPECT_TRUE(lines.contains("Average Loudness: -9.03 dB"));
  EXPECT_TRUE(lines.contains("A: 1.000"));
  EXPECT_TRUE(lines.contains("C: 0.000"));
}

TEST(ReportFormatter, UnavailableChromaIsOneLine) {
  AnalysisReport r = sampleReport();
  r.features.chroma = ChromaFeature::unavailable("signal is silent");
  const QString text = ReportFormatter::toText(r);
  EXPECT_TRUE(text.contains("Chroma Features:\nunavailable (signal is silent)\n"));
  EXPECT_FALSE(text.contains("A: "));
}

TEST(ReportFormatter, JsonShape) {
  const QJsonObject root = ReportFormatter::toJson(sampleReport());
  EXPECT_FALSE(root.contains("visualization"));

  const QJsonObject features = root.value("features").toObject();
  for (const char* key : {"duration", "sample_rate", "sampling_frequency", "channels", "max_amplitude",
                          "average_amplitude", "min_frequency", "max_frequency", "tempo",
                          "average_loudness", "chroma"})
    EXPECT_TRUE(features.contains(key)) << key;

  EXPECT_DOUBLE_EQ(features.value("max_amplitude").toDouble(), 0.5);
  EXPECT_EQ(features.value("tempo").toObject().value("unavailable").toString(), "signal is silent");
  EXPECT_DOUBLE_EQ(features.value("chroma").toObject().value("A").toDouble(), 1.0);

  const QJsonObject meta = root.value("metadata").toObject();
  EXPECT_EQ(meta.value("artist").toString(), "Unknown");
  EXPECT_EQ(meta.value("title").toString(), "Song");
  EXPECT_EQ(root.value("file").toObject().value("md5").toString().size(), 32);
}

TEST(ReportFormatter, VisualsAreOptIn) {
  AnalysisReport r = sampleReport();
  const AudioSignal signal = monoSignal(makeSine(440.0, 0.2, 22050), 22050);
  SpectralTransformer t(2048, 512, 8);
  r.visuals = VisualizationBuilder::build(signal, t.analyze(signal.mono(), 22050));

  const QJsonObject root = ReportFormatter::toJson(r, true);
  ASSERT_TRUE(root.contains("visualization"));
  const QJsonObject v = root.value("visualization").toObject();
  EXPECT_EQ(v.value("waveform").toObject().value("samples").toArray().size(), signal.frameCount());
  EXPECT_EQ(v.value("spectrum").toObject().value("magnitudes").toArray().size(), 1025);
  EXPECT_EQ(v.value("spectrogram").toObject().value("magnitudes").toArray().size(),
            r.visuals.spectrogram.columnCount());

  const QJsonDocument doc = QJsonDocument::fromJson(ReportFormatter::toJsonBytes(r));
  EXPECT_TRUE(doc.isObject());
  EXPECT_FALSE(doc.object().contains("visualization"));
}
