#include "AudioAnalyzer.h"
#include "AudioDecoder.h"
#include "FeatureExtractor.h"
#include "Logging.h"
#include "SpectralTransformer.h"
#include <QElapsedTimer>
#include <QThread>
#include <memory>

QString AnalysisResult::statusName(Status s) {
  switch (s) {
    case Status::Success:      return QStringLiteral("success");
    case Status::DecodeFailed: return QStringLiteral("decode failed");
    case Status::Cancelled:    return QStringLiteral("cancelled");
  }
  return QString();
}

static void logUnavailable(const char* name, const ScalarFeature& f) {
  if (!f.isAvailable()) qCDebug(lcFeatures) << name << "unavailable:" << f.reason;
}

AnalysisResult AudioAnalyzer::analyze(const QString& path, const AnalysisConfig& requested,
                                      const std::atomic<bool>* cancel, const ProgressFn& progress)
{
  QElapsedTimer timer;
  timer.start();

  AnalysisConfig config = requested;
  const QStringList problems = config.validate();
  if (!problems.isEmpty()) {
    qCWarning(lcPipeline) << "invalid config, using defaults:" << problems.join("; ");
    config = AnalysisConfig();
  }

  auto cancelled = [&] { return cancel && cancel->load(); };
  auto stage = [&](const QString& what) {
    qCDebug(lcPipeline).noquote() << "stage:" << what;
    if (progress) progress(what);
  };
  auto stopped = [&] {
    qCInfo(lcPipeline) << "analysis cancelled:" << path;
    AnalysisResult r;
    r.status = AnalysisResult::Status::Cancelled;
    return r;
  };

  if (cancelled()) return stopped();

  // 1) Decode. All disk access happens here.
  stage(QString("Decoding %1").arg(path));
  const AudioDecoder decoder(config);
  DecodeResult decoded = decoder.decode(path);
  if (!decoded.ok()) {
    AnalysisResult r;
    r.status = AnalysisResult::Status::DecodeFailed;
    r.error = decoded.error;
    return r;
  }
  FileDetails file = FileDetails::read(path);
  TrackMetadata metadata = TagReader::read(path);
  if (cancelled()) return stopped();

  const AudioSignal& signal = *decoded.signal;
  const FeatureExtractor fx(config);

  // 2) STFT, on its own thread when allowed
  SpectralAnalysis spectral;
  bool transformOk = true;
  auto runTransform = [&] {
    SpectralTransformer transformer(config.frameSize, config.hopSize, config.envelopeOrder);
    if (!transformer.isValid()) { transformOk = false; return; }
    spectral = transformer.analyze(signal.mono(), signal.sampleRate());
  };

  std::unique_ptr<QThread> transformThread;
  if (config.parallel) {
    transformThread.reset(QThread::create(runTransform));
    transformThread->setObjectName("stft");
    transformThread->start();
  } else {
    stage("Spectral transform");
    runTransform();
  }

  // 3) Time-domain features meanwhile
  stage("Signal features");
  SignalFeatures sf;
  const bool signalDone = fx.extractSignalFeatures(signal, sf, cancelled);

  // Join: spectral features need the frames.
  if (transformThread) transformThread->wait();
  if (!signalDone || cancelled()) return stopped();

  // 4) Spectral features, one at a time
  stage("Spectral features");
  SpectralFeatures spf;
  if (!transformOk) {
    const ScalarFeature u = ScalarFeature::unavailable("spectral transform could not be set up");
    spf.minFrequencyHz = spf.maxFrequencyHz = spf.tempoBpm = u;
    spf.chroma = ChromaFeature::unavailable(u.reason);
    if (config.loudnessWeighting == LoudnessWeighting::AWeighted) spf.weightedLoudnessDb = u;
  } else if (!fx.extractSpectralFeatures(signal, spectral, spf, cancelled)) {
    return stopped();
  }

  FeatureReport features = FeatureReport::assemble(sf, spf);
  logUnavailable("max amplitude", features.maxAmplitude);
  logUnavailable("average amplitude", features.averageAmplitude);
  logUnavailable("min frequency", features.minFrequencyHz);
  logUnavailable("max frequency", features.maxFrequencyHz);
  logUnavailable("tempo", features.tempoBpm);
  logUnavailable("loudness", features.averageLoudnessDb);
  if (!features.chroma.isAvailable()) qCDebug(lcFeatures) << "chroma unavailable:" << features.chroma.reason;

  // 5) Visualizations
  stage("Visualization data");
  VisualizationData visuals = VisualizationBuilder::build(signal, spectral);
  if (cancelled()) return stopped();

  // 6) Finalize
  AnalysisResult r;
  r.status = AnalysisResult::Status::Success;
  r.report = AnalysisReport{std::move(file), std::move(metadata), std::move(features), std::move(visuals)};
  qCInfo(lcPipeline) << "analyzed" << path << "in" << timer.elapsed() << "ms";
  return r;
}
