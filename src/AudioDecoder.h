#pragma once
#include <QString>
#include <optional>
#include "AnalysisConfig.h"
#include "AudioSignal.h"
#include "DecodeError.h"

struct DecodeResult {
  std::optional<AudioSignal> signal;
  std::optional<DecodeError> error;
  bool ok() const { return signal.has_value(); }
};

// File -> AudioSignal through miniaudio's decoders (WAV/AIFF, FLAC, MP3;
// Ogg when the build provides a Vorbis backend).
class AudioDecoder {
public:
  explicit AudioDecoder(const AnalysisConfig& config = AnalysisConfig());

  DecodeResult decode(const QString& path) const;

private:
  AnalysisConfig _config;
};
