#pragma once
#include <QString>
#include <QStringList>

enum class LoudnessWeighting {
  Flat,       // plain frame energy
  AWeighted   // IEC 61672 A-curve applied per FFT bin
};

struct AnalysisConfig {
  // Decoding
  int analysisSampleRate = 22050;   // 0 keeps the file's native rate
  QStringList supportedFormats = {"wav", "flac", "mp3", "ogg", "aiff", "aif"};

  // STFT
  int frameSize = 2048;             // even, >= 64
  int hopSize   = 512;              // 1..frameSize

  // Spectral features
  double noiseFloorDb       = 24.0;    // bins within this of the strongest bin count as signal
  double silenceThresholdDb = -80.0;   // dBFS; below this the signal is treated as silent
  int    envelopeOrder      = 8;       // moving-average half width (bins)

  // Tempo
  double minTempoSeconds = 4.0;
  double minTempoBpm     = 30.0;
  double maxTempoBpm     = 300.0;
  double tempoPriorBpm   = 120.0;

  // Loudness
  double loudnessRangeDb = 80.0;       // frames quieter than (loudest - range) are clipped
  LoudnessWeighting loudnessWeighting = LoudnessWeighting::Flat;

  // Chroma
  double chromaMinHz = 65.406;         // C2
  double chromaMaxHz = 5000.0;

  // Run the spectral transform on its own thread while time-domain features compute.
  bool parallel = true;

  // Empty when the config is usable; otherwise one message per problem.
  QStringList validate() const;

  bool isSupportedFormat(const QString& extension) const;
};

// Reads a JSON object on top of `config`. Keys that are absent keep their
// current value. Returns false (and fills `error`) on I/O, parse or type errors.
bool loadConfig(const QString& path, AnalysisConfig& config, QString* error = nullptr);

QString loudnessWeightingName(LoudnessWeighting w);
bool parseLoudnessWeighting(const QString& name, LoudnessWeighting& out);
