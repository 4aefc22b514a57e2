#include "AnalysisWorker.h"

AnalysisWorker::AnalysisWorker(const AnalysisConfig& config, QObject* parent)
  : QObject(parent), _config(config)
{
  qRegisterMetaType<AnalysisResult>("AnalysisResult");
}

void AnalysisWorker::requestStop() {
  _cancel.store(true);
}

void AnalysisWorker::analyzeFile(const QString& path) {
  // Prevent double-start.
  if (_running.exchange(true)) {
    emit status("Analysis already running");
    return;
  }
  _cancel.store(false);

  AnalysisResult result = AudioAnalyzer::analyze(path, _config, &_cancel,
                                                 [this](const QString& msg) { emit status(msg); });
  switch (result.status) {
    case AnalysisResult::Status::Success:
      emit status(QString("Done: %1").arg(path));
      break;
    case AnalysisResult::Status::DecodeFailed:
      emit status(result.error->message());
      break;
    case AnalysisResult::Status::Cancelled:
      emit status("Analysis cancelled");
      break;
  }

  _running.store(false);
  emit finished(result);
  if (result.status == AnalysisResult::Status::Cancelled) emit stopped();
}
