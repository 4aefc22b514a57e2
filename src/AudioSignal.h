#pragma once
#include <QVector>
#include <QtGlobal>

// Decoded PCM, planar float channels in WAV/Microsoft channel order
// (FL, FR, FC, LFE, BL, BR, ...). Never modified once built.
class AudioSignal {
public:
  AudioSignal() = default;
  AudioSignal(QVector<QVector<float>> channels, int sampleRate, int nativeSampleRate);

  // Rate the samples are stored at (the analysis "sampling frequency").
  int sampleRate() const { return _sampleRate; }
  // Rate found in the file before any resampling.
  int nativeSampleRate() const { return _nativeSampleRate; }
  bool wasResampled() const { return _sampleRate != _nativeSampleRate; }

  int channelCount() const { return _channels.size(); }
  qint64 frameCount() const { return _channels.isEmpty() ? 0 : _channels.first().size(); }
  double durationSeconds() const;
  bool isEmpty() const { return frameCount() == 0; }

  const QVector<float>& channel(int index) const { return _channels.at(index); }
  const QVector<QVector<float>>& channels() const { return _channels; }

  // Arithmetic mean of all channels. Shares storage with channel 0 for mono input.
  const QVector<float>& mono() const { return _mono; }

  bool operator==(const AudioSignal& other) const;
  bool operator!=(const AudioSignal& other) const { return !(*this == other); }

private:
  QVector<QVector<float>> _channels;
  QVector<float> _mono;
  int _sampleRate = 0;
  int _nativeSampleRate = 0;
};
