#include "FeatureReport.h"

const char* const FeatureReport::kChromaNotes[12] = {
  "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

FeatureReport FeatureReport::assemble(const SignalFeatures& s, const SpectralFeatures& f) {
  FeatureReport r;
  r.durationSeconds   = s.durationSeconds;
  r.sampleRate        = s.sampleRate;
  r.samplingFrequency = s.samplingFrequency;
  r.channels          = s.channels;
  r.maxAmplitude      = s.maxAmplitude;
  r.averageAmplitude  = s.averageAmplitude;
  r.averageLoudnessDb = f.weightedLoudnessDb ? *f.weightedLoudnessDb : s.averageLoudnessDb;
  r.minFrequencyHz    = f.minFrequencyHz;
  r.maxFrequencyHz    = f.maxFrequencyHz;
  r.tempoBpm          = f.tempoBpm;
  r.chroma            = f.chroma;
  return r;
}

bool FeatureReport::operator==(const FeatureReport& o) const {
  return durationSeconds == o.durationSeconds
      && sampleRate == o.sampleRate
      && samplingFrequency == o.samplingFrequency
      && channels == o.channels
      && maxAmplitude == o.maxAmplitude
      && averageAmplitude == o.averageAmplitude
      && minFrequencyHz == o.minFrequencyHz
      && maxFrequencyHz == o.maxFrequencyHz
      && tempoBpm == o.tempoBpm
      && averageLoudnessDb == o.averageLoudnessDb
      && chroma == o.chroma;
}
