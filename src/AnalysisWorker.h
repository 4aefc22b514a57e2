#pragma once
#include <QMetaType>
#include <QObject>
#include <QString>
#include <atomic>
#include "AnalysisConfig.h"
#include "AudioAnalyzer.h"

Q_DECLARE_METATYPE(AnalysisResult)

// Runs AudioAnalyzer::analyze on whatever thread it is moved to.
class AnalysisWorker : public QObject {
  Q_OBJECT
public:
  explicit AnalysisWorker(const AnalysisConfig& config = AnalysisConfig(), QObject* parent = nullptr);

public slots:
  // state management
  void analyzeFile(const QString& path);
  void requestStop();   // thread-safe, only flips a flag

signals:
  void status(const QString& msg);
  void finished(const AnalysisResult& result);
  void stopped();

private:
  AnalysisConfig _config;
  std::atomic<bool> _running{false};
  std::atomic<bool> _cancel{false};
};
