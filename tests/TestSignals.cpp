#include "TestSignals.h"
#include <QFile>
#include <cmath>
#include <vector>
#include "miniaudio.h"

QVector<float> makeSine(double hz, double seconds, int sampleRate, float amplitude) {
  const int n = int(std::lround(seconds * sampleRate));
  QVector<float> out(n);
  for (int i = 0; i < n; ++i) out[i] = amplitude * float(std::sin(2.0 * M_PI * hz * i / sampleRate));
  return out;
}

QVector<float> makeSilence(double seconds, int sampleRate) {
  return QVector<float>(int(std::lround(seconds * sampleRate)), 0.0f);
}

QVector<float> makeNoise(double seconds, int sampleRate, float amplitude, quint32 seed) {
  const int n = int(std::lround(seconds * sampleRate));
  QVector<float> out(n);
  quint32 state = seed;
  for (int i = 0; i < n; ++i) {
    state = state * 1664525u + 1013904223u;
    out[i] = amplitude * (float(state >> 8) / float(1u << 24) * 2.0f - 1.0f);
  }
  return out;
}

QVector<float> makeClickTrack(double bpm, double seconds, int sampleRate) {
  QVector<float> out = makeSilence(seconds, sampleRate);
  const double period = 60.0 / bpm;
  const int burst = int(0.02 * sampleRate);
  for (double t = 0.0; t < seconds; t += period) {
    const int start = int(std::lround(t * sampleRate));
    for (int i = 0; i < burst && start + i < out.size(); ++i) {
      const double env = std::exp(-double(i) / (0.004 * sampleRate));
      out[start + i] = float(0.8 * env * std::sin(2.0 * M_PI * 1000.0 * i / sampleRate));
    }
  }
  return out;
}

QVector<float> mix(const QVector<float>& a, const QVector<float>& b) {
  QVector<float> out(std::max(a.size(), b.size()), 0.0f);
  for (int i = 0; i < a.size(); ++i) out[i] += a[i];
  for (int i = 0; i < b.size(); ++i) out[i] += b[i];
  return out;
}

AudioSignal monoSignal(const QVector<float>& samples, int sampleRate) {
  return AudioSignal(QVector<QVector<float>>{samples}, sampleRate, sampleRate);
}

bool writeWav(const QString& path, const QVector<QVector<float>>& channels, int sampleRate) {
  if (channels.isEmpty()) return false;
  const ma_uint32 ch = ma_uint32(channels.size());
  const int frames = channels.first().size();

  std::vector<float> interleaved(size_t(frames) * ch);
  for (int i = 0; i < frames; ++i)
    for (ma_uint32 c = 0; c < ch; ++c) interleaved[size_t(i) * ch + c] = channels[int(c)][i];

  ma_encoder_config cfg = ma_encoder_config_init(ma_encoding_format_wav, ma_format_f32, ch, ma_uint32(sampleRate));
  ma_encoder enc;
  const QByteArray encoded = QFile::encodeName(path);
  if (ma_encoder_init_file(encoded.constData(), &cfg, &enc) != MA_SUCCESS) return false;

  ma_uint64 written = 0;
  const ma_result res = frames > 0
      ? ma_encoder_write_pcm_frames(&enc, interleaved.data(), ma_uint64(frames), &written)
      : MA_SUCCESS;
  ma_encoder_uninit(&enc);
  return res == MA_SUCCESS && written == ma_uint64(frames);
}
