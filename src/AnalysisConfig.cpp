#include "AnalysisConfig.h"
#include "Logging.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

QStringList AnalysisConfig::validate() const {
  QStringList problems;
  if (analysisSampleRate < 0)
    problems << QString("analysis_sample_rate must be >= 0 (got %1)").arg(analysisSampleRate);
  if (frameSize < 64 || (frameSize % 2) != 0)
    problems << QString("frame_size must be even and >= 64 (got %1)").arg(frameSize);
  if (hopSize < 1 || hopSize > frameSize)
    problems << QString("hop_size must be in 1..frame_size (got %1)").arg(hopSize);
  if (noiseFloorDb <= 0.0)
    problems << "noise_floor_db must be positive";
  if (envelopeOrder < 0)
    problems << "envelope_order must be >= 0";
  if (minTempoSeconds <= 0.0)
    problems << "min_tempo_seconds must be positive";
  if (minTempoBpm <= 0.0 || maxTempoBpm <= minTempoBpm)
    problems << "tempo range must satisfy 0 < min_tempo_bpm < max_tempo_bpm";
  if (tempoPriorBpm <= 0.0)
    problems << "tempo_prior_bpm must be positive";
  if (loudnessRangeDb <= 0.0)
    problems << "loudness_range_db must be positive";
  if (chromaMinHz <= 0.0 || chromaMaxHz <= chromaMinHz)
    problems << "chroma range must satisfy 0 < chroma_min_hz < chroma_max_hz";
  if (supportedFormats.isEmpty())
    problems << "supported_formats must not be empty";
  return problems;
}

bool AnalysisConfig::isSupportedFormat(const QString& extension) const {
  return supportedFormats.contains(extension.trimmed(), Qt::CaseInsensitive);
}

QString loudnessWeightingName(LoudnessWeighting w) {
  return w == LoudnessWeighting::AWeighted ? QStringLiteral("a-weighted") : QStringLiteral("flat");
}

bool parseLoudnessWeighting(const QString& name, LoudnessWeighting& out) {
  const QString n = name.trimmed().toLower();
  if (n == "flat" || n == "none") { out = LoudnessWeighting::Flat; return true; }
  if (n == "a-weighted" || n == "a") { out = LoudnessWeighting::AWeighted; return true; }
  return false;
}

namespace {

// Small typed readers; each returns false on a type mismatch.
bool readInt(const QJsonObject& o, const char* key, int& out, QString& err) {
  if (!o.contains(key)) return true;
  const QJsonValue v = o.value(key);
  if (!v.isDouble()) { err = QString("'%1' must be a number").arg(key); return false; }
  out = v.toInt();
  return true;
}

bool readDouble(const QJsonObject& o, const char* key, double& out, QString& err) {
  if (!o.contains(key)) return true;
  const QJsonValue v = o.value(key);
  if (!v.isDouble()) { err = QString("'%1' must be a number").arg(key); return false; }
  out = v.toDouble();
  return true;
}

bool readBool(const QJsonObject& o, const char* key, bool& out, QString& err) {
  if (!o.contains(key)) return true;
  const QJsonValue v = o.value(key);
  if (!v.isBool()) { err = QString("'%1' must be true or false").arg(key); return false; }
  out = v.toBool();
  return true;
}

} // namespace

bool loadConfig(const QString& path, AnalysisConfig& config, QString* error) {
  auto fail = [&](const QString& msg) {
    qCWarning(lcPipeline) << "config:" << msg;
    if (error) *error = msg;
    return false;
  };

  QFile f(path);
  if (!f.open(QIODevice::ReadOnly))
    return fail(QString("cannot open %1: %2").arg(path, f.errorString()));

  QJsonParseError perr;
  const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
  if (perr.error != QJsonParseError::NoError)
    return fail(QString("%1: %2 at offset %3").arg(path, perr.errorString()).arg(perr.offset));
  if (!doc.isObject())
    return fail(QString("%1: top level must be an object").arg(path));

  const QJsonObject o = doc.object();
  AnalysisConfig c = config;   // only commit on success
  QString err;

  const bool ok =
      readInt(o, "analysis_sample_rate", c.analysisSampleRate, err) &&
      readInt(o, "frame_size", c.frameSize, err) &&
      readInt(o, "hop_size", c.hopSize, err) &&
      readDouble(o, "noise_floor_db", c.noiseFloorDb, err) &&
      readDouble(o, "silence_threshold_db", c.silenceThresholdDb, err) &&
      readInt(o, "envelope_order", c.envelopeOrder, err) &&
      readDouble(o, "min_tempo_seconds", c.minTempoSeconds, err) &&
      readDouble(o, "min_tempo_bpm", c.minTempoBpm, err) &&
      readDouble(o, "max_tempo_bpm", c.maxTempoBpm, err) &&
      readDouble(o, "tempo_prior_bpm", c.tempoPriorBpm, err) &&
      readDouble(o, "loudness_range_db", c.loudnessRangeDb, err) &&
      readDouble(o, "chroma_min_hz", c.chromaMinHz, err) &&
      readDouble(o, "chroma_max_hz", c.chromaMaxHz, err) &&
      readBool(o, "parallel", c.parallel, err);
  if (!ok) return fail(QString("%1: %2").arg(path, err));

  if (o.contains("loudness_weighting")) {
    const QJsonValue v = o.value("loudness_weighting");
    if (!v.isString() || !parseLoudnessWeighting(v.toString(), c.loudnessWeighting))
      return fail(QString("%1: 'loudness_weighting' must be \"flat\" or \"a-weighted\"").arg(path));
  }

  if (o.contains("supported_formats")) {
    const QJsonValue v = o.value("supported_formats");
    if (!v.isArray()) return fail(QString("%1: 'supported_formats' must be an array").arg(path));
    QStringList formats;
    for (const QJsonValue& item : v.toArray()) {
      if (!item.isString()) return fail(QString("%1: 'supported_formats' entries must be strings").arg(path));
      formats << item.toString().trimmed().toLower();
    }
    c.supportedFormats = formats;
  }

  config = c;
  qCDebug(lcPipeline) << "config loaded from" << path;
  return true;
}
