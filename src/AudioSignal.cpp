#include "AudioSignal.h"
#include <cstring>
#include <utility>

AudioSignal::AudioSignal(QVector<QVector<float>> channels, int sampleRate, int nativeSampleRate)
  : _channels(std::move(channels)), _sampleRate(sampleRate), _nativeSampleRate(nativeSampleRate)
{
  if (_channels.isEmpty()) return;

  if (_channels.size() == 1) {
    _mono = _channels.first();   // implicit share, no copy
    return;
  }

  // Downmix: plain average, accumulated in double.
  const int frames = _channels.first().size();
  const int ch = _channels.size();
  _mono.resize(frames);
  for (int i = 0; i < frames; ++i) {
    double acc = 0.0;
    for (int c = 0; c < ch; ++c) acc += _channels[c][i];
    _mono[i] = float(acc / ch);
  }
}

double AudioSignal::durationSeconds() const {
  if (_sampleRate <= 0) return 0.0;
  return double(frameCount()) / double(_sampleRate);
}

bool AudioSignal::operator==(const AudioSignal& other) const {
  if (_sampleRate != other._sampleRate || _nativeSampleRate != other._nativeSampleRate) return false;
  if (_channels.size() != other._channels.size()) return false;
  for (int c = 0; c < _channels.size(); ++c) {
    const QVector<float>& a = _channels[c];
    const QVector<float>& b = other._channels[c];
    if (a.size() != b.size()) return false;
    // Bitwise, so NaN payloads and -0.0f compare exactly.
    if (!a.isEmpty() && std::memcmp(a.constData(), b.constData(), sizeof(float) * a.size()) != 0)
      return false;
  }
  return true;
}
