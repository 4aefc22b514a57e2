#include "ReportFormatter.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>

namespace {

QString scalar(const ScalarFeature& f, int decimals, const QString& unit) {
  if (!f.isAvailable()) return QString("unavailable (%1)").arg(f.reason);
  const QString v = QString::number(*f, 'f', decimals);
  return unit.isEmpty() ? v : QString("%1 %2").arg(v, unit);
}

QJsonValue scalarJson(const ScalarFeature& f) {
  if (f.isAvailable()) return *f;
  QJsonObject o;
  o.insert("unavailable", f.reason);
  return o;
}

QJsonValue optionalText(const std::optional<QString>& s) {
  return s ? QJsonValue(*s) : QJsonValue(TrackMetadata::kUnknown);
}

QJsonArray floats(const QVector<float>& v) {
  QJsonArray a;
  for (float x : v) a.append(double(x));
  return a;
}

} // namespace

QString ReportFormatter::toText(const AnalysisReport& report) {
  const FileDetails& fd = report.file;
  const TrackMetadata& md = report.metadata;
  const FeatureReport& f = report.features;

  QStringList lines;
  lines << QString("File Name: %1").arg(fd.fileName)
        << QString("Audio File Format: %1").arg(fd.format)
        << QString("Last Modified: %1").arg(fd.lastModified.toString("yyyy-MM-dd HH:mm:ss"))
        << QString("File Hash: %1").arg(fd.md5 ? *fd.md5 : TrackMetadata::kUnknown)
        << QString();

  lines << QString("Artist: %1").arg(TrackMetadata::display(md.artist))
        << QString("Title: %1").arg(TrackMetadata::display(md.title))
        << QString("Album: %1").arg(TrackMetadata::display(md.album))
        << QString("Year: %1").arg(TrackMetadata::display(md.year))
        << QString("Genre: %1").arg(TrackMetadata::display(md.genre))
        << QString();

  lines << QString("File Duration: %1 seconds").arg(f.durationSeconds, 0, 'f', 2)
        << QString("Sample Rate: %1 Hz").arg(f.sampleRate)
        << QString("Sampling Frequency: %1 Hz").arg(f.samplingFrequency)
        << QString("Number of Channels: %1").arg(f.channels)
        << QString("Maximum Amplitude: %1").arg(scalar(f.maxAmplitude, 2, "(scaled value)"))
        << QString("Average Amplitude: %1").arg(scalar(f.averageAmplitude, 2, "(scaled value)"))
        << QString("Minimum Frequency: %1").arg(scalar(f.minFrequencyHz, 2, "Hz"))
        << QString("Maximum Frequency: %1").arg(scalar(f.maxFrequencyHz, 2, "Hz"))
        << QString();

  lines << QString("Tempo: %1").arg(scalar(f.tempoBpm, 2, "BPM"))
        << QString("Average Loudness: %1").arg(scalar(f.averageLoudnessDb, 2, "dB"))
        << QString()
        << QString("Chroma Features:");
  if (f.chroma.isAvailable()) {
    for (int i = 0; i < 12; ++i)
      lines << QString("%1: %2").arg(FeatureReport::kChromaNotes[i]).arg((*f.chroma)[i], 0, 'f', 3);
  } else {
    lines << QString("unavailable (%1)").arg(f.chroma.reason);
  }
  return lines.join('\n') + '\n';
}

QJsonObject ReportFormatter::toJson(const AnalysisReport& report, bool includeVisuals) {
  const FileDetails& fd = report.file;
  const TrackMetadata& md = report.metadata;
  const FeatureReport& f = report.features;

  QJsonObject file;
  file.insert("name", fd.fileName);
  file.insert("format", fd.format);
  file.insert("size_bytes", double(fd.sizeBytes));
  file.insert("last_modified", fd.lastModified.toString(Qt::ISODate));
  file.insert("md5", fd.md5 ? QJsonValue(*fd.md5) : QJsonValue());

  QJsonObject meta;
  meta.insert("artist", optionalText(md.artist));
  meta.insert("title", optionalText(md.title));
  meta.insert("album", optionalText(md.album));
  meta.insert("year", optionalText(md.year));
  meta.insert("genre", optionalText(md.genre));

  QJsonObject features;
  features.insert("duration", f.durationSeconds);
  features.insert("sample_rate", f.sampleRate);
  features.insert("sampling_frequency", f.samplingFrequency);
  features.insert("channels", f.channels);
  features.insert("max_amplitude", scalarJson(f.maxAmplitude));
  features.insert("average_amplitude", scalarJson(f.averageAmplitude));
  features.insert("min_frequency", scalarJson(f.minFrequencyHz));
  features.insert("max_frequency", scalarJson(f.maxFrequencyHz));
  features.insert("tempo", scalarJson(f.tempoBpm));
  features.insert("average_loudness", scalarJson(f.averageLoudnessDb));
  if (f.chroma.isAvailable()) {
    QJsonObject chroma;
    for (int i = 0; i < 12; ++i) chroma.insert(FeatureReport::kChromaNotes[i], (*f.chroma)[i]);
    features.insert("chroma", chroma);
  } else {
    QJsonObject u;
    u.insert("unavailable", f.chroma.reason);
    features.insert("chroma", u);
  }

  QJsonObject root;
  root.insert("file", file);
  root.insert("metadata", meta);
  root.insert("features", features);
  if (includeVisuals) root.insert("visualization", visualsToJson(report.visuals));
  return root;
}

QJsonObject ReportFormatter::visualsToJson(const VisualizationData& v) {
  QJsonObject waveform;
  waveform.insert("sample_rate", v.waveform.sampleRate);
  waveform.insert("duration", v.waveform.durationSeconds);
  waveform.insert("samples", floats(v.waveform.samples));

  QJsonObject spectrogram;
  spectrogram.insert("seconds_per_column", v.spectrogram.secondsPerColumn);
  spectrogram.insert("bin_hz", v.spectrogram.binHz);
  spectrogram.insert("amplitude_scale", v.spectrogram.amplitudeScale);
  QJsonArray times, columns;
  for (double t : v.spectrogram.columnTimes) times.append(t);
  for (const QVector<float>& c : v.spectrogram.columns) columns.append(floats(c));
  spectrogram.insert("column_times", times);
  spectrogram.insert("magnitudes", columns);

  QJsonObject spectrum;
  spectrum.insert("frequencies", floats(v.spectrum.frequencies));
  spectrum.insert("magnitudes", floats(v.spectrum.magnitudes));

  QJsonObject envelope;
  envelope.insert("frequencies", floats(v.envelope.frequencies));
  envelope.insert("levels_db", floats(v.envelope.levelsDb));
  envelope.insert("order", v.envelope.order);

  QJsonObject out;
  out.insert("waveform", waveform);
  out.insert("spectrogram", spectrogram);
  out.insert("spectrum", spectrum);
  out.insert("envelope", envelope);
  out.insert("peak_level_db", floats(v.peakLevelDb));
  return out;
}

QByteArray ReportFormatter::toJsonBytes(const AnalysisReport& report, bool includeVisuals) {
  return QJsonDocument(toJson(report, includeVisuals)).toJson(QJsonDocument::Indented);
}
