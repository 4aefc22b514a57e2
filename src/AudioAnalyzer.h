#pragma once
#include <QString>
#include <atomic>
#include <functional>
#include <optional>
#include "AnalysisConfig.h"
#include "DecodeError.h"
#include "FeatureReport.h"
#include "FileDetails.h"
#include "TagReader.h"
#include "VisualizationBuilder.h"

struct AnalysisReport {
  FileDetails file;
  TrackMetadata metadata;
  FeatureReport features;
  VisualizationData visuals;
};

struct AnalysisResult {
  enum class Status { Success, DecodeFailed, Cancelled };

  Status status = Status::Cancelled;
  std::optional<AnalysisReport> report;   // only on Success
  std::optional<DecodeError> error;       // only on DecodeFailed

  bool ok() const { return status == Status::Success; }
  static QString statusName(Status s);
};

// Stateless entry point. Safe to call from several threads at once; every
// call owns its decoder, FFT plan and buffers.
class AudioAnalyzer {
public:
  using ProgressFn = std::function<void(const QString&)>;

  // Decode -> {signal features || STFT} -> spectral features -> visualizations.
  // `cancel` is polled between stages; a set flag ends the run as Cancelled.
  static AnalysisResult analyze(const QString& path,
                                const AnalysisConfig& config = AnalysisConfig(),
                                const std::atomic<bool>* cancel = nullptr,
                                const ProgressFn& progress = ProgressFn());
};
