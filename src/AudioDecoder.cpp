#include "AudioDecoder.h"
#include "Logging.h"
#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <climits>
#include <vector>
#include "miniaudio.h"

namespace {

DecodeResult failure(DecodeError::Reason reason, const QString& path, const QString& detail) {
  DecodeResult r;
  r.error = DecodeError{reason, path, detail};
  qCWarning(lcDecode).noquote() << r.error->message();
  return r;
}

DecodeError::Reason reasonForInit(ma_result res) {
  switch (res) {
    case MA_DOES_NOT_EXIST:        return DecodeError::Reason::NotFound;
    case MA_ACCESS_DENIED:         return DecodeError::Reason::Unreadable;
    case MA_NO_BACKEND:
    case MA_INVALID_FILE:
    case MA_FORMAT_NOT_SUPPORTED:  return DecodeError::Reason::UnsupportedFormat;
    default:                       return DecodeError::Reason::Corrupt;
  }
}

QString describe(ma_result res) {
  return QString("miniaudio: %1 (%2)").arg(QString::fromLatin1(ma_result_description(res))).arg(int(res));
}

// Owns an initialized decoder for the duration of one decode call.
struct DecoderHandle {
  ma_decoder dec{};
  bool live = false;
  ~DecoderHandle() { if (live) ma_decoder_uninit(&dec); }
};

struct ResamplerHandle {
  ma_resampler rs{};
  bool live = false;
  ~ResamplerHandle() { if (live) ma_resampler_uninit(&rs, nullptr); }
};

// For each output slot, which source channel lands there so the result
// follows the Microsoft/WAV order. Identity when the maps don't line up.
std::vector<int> standardOrder(const ma_channel* srcMap, ma_uint32 channels) {
  std::vector<int> order(channels);
  for (ma_uint32 i = 0; i < channels; ++i) order[i] = int(i);
  if (channels < 2) return order;

  ma_channel stdMap[MA_MAX_CHANNELS];
  ma_channel_map_init_standard(ma_standard_channel_map_microsoft, stdMap, MA_MAX_CHANNELS, channels);

  std::vector<int> mapped(channels, -1);
  std::vector<bool> used(channels, false);
  for (ma_uint32 i = 0; i < channels; ++i) {
    for (ma_uint32 j = 0; j < channels; ++j) {
      if (!used[j] && srcMap[j] == stdMap[i] && srcMap[j] != MA_CHANNEL_NONE) {
        mapped[i] = int(j);
        used[j] = true;
        break;
      }
    }
    if (mapped[i] < 0) return order;   // unmatched position: keep native order
  }
  return mapped;
}

// Linear resample of an interleaved f32 stream. Appends latency-flush zeros
// so the output length tracks inFrames * outRate / inRate.
bool resampleInterleaved(const std::vector<float>& in, ma_uint32 channels,
                         ma_uint32 inRate, ma_uint32 outRate,
                         std::vector<float>& out, QString& err)
{
  const ma_uint64 inFrames = in.size() / channels;
  const ma_uint64 target = (inFrames * outRate + inRate / 2) / inRate;

  ResamplerHandle h;
  ma_resampler_config rc = ma_resampler_config_init(ma_format_f32, channels, inRate, outRate,
                                                    ma_resample_algorithm_linear);
  ma_result res = ma_resampler_init(&rc, nullptr, &h.rs);
  if (res != MA_SUCCESS) { err = describe(res); return false; }
  h.live = true;

  out.assign(size_t(target) * channels, 0.0f);
  const ma_uint64 flushChunk = 1024;
  const std::vector<float> zeros(size_t(flushChunk) * channels, 0.0f);

  ma_uint64 consumed = 0, produced = 0;
  int flushPasses = 0;
  while (produced < target) {
    const bool flushing = consumed >= inFrames;
    if (flushing && ++flushPasses > 64) break;

    const float* src = flushing ? zeros.data() : in.data() + consumed * channels;
    ma_uint64 frameIn  = flushing ? flushChunk : inFrames - consumed;
    ma_uint64 frameOut = target - produced;
    res = ma_resampler_process_pcm_frames(&h.rs, src, &frameIn, out.data() + produced * channels, &frameOut);
    if (res != MA_SUCCESS) { err = describe(res); return false; }

    if (!flushing) consumed += frameIn;
    produced += frameOut;
    if (frameIn == 0 && frameOut == 0) break;
  }
  out.resize(size_t(produced) * channels);
  return true;
}

} // namespace

AudioDecoder::AudioDecoder(const AnalysisConfig& config)
  : _config(config) {}

DecodeResult AudioDecoder::decode(const QString& path) const {
  using Reason = DecodeError::Reason;

  // 1) Cheap checks before touching the decoder
  const QFileInfo info(path);
  if (!info.exists())   return failure(Reason::NotFound, path, QString());
  if (!info.isFile())   return failure(Reason::Unreadable, path, "not a regular file");
  if (!info.isReadable()) return failure(Reason::Unreadable, path, "permission denied");
  if (info.size() == 0) return failure(Reason::Empty, path, "file is zero bytes");

  const QString ext = info.suffix().toLower();
  if (!_config.isSupportedFormat(ext)) {
    return failure(Reason::UnsupportedFormat, path,
                   QString("extension '%1' is not one of: %2").arg(ext, _config.supportedFormats.join(", ")));
  }

  // 2) Open. Native channel count and rate, always f32.
  DecoderHandle h;
  ma_decoder_config cfg = ma_decoder_config_init(ma_format_f32, 0, 0);
  const QByteArray encoded = QFile::encodeName(path);
  ma_result res = ma_decoder_init_file(encoded.constData(), &cfg, &h.dec);
  if (res != MA_SUCCESS) return failure(reasonForInit(res), path, describe(res));
  h.live = true;

  ma_format fmt = ma_format_unknown;
  ma_uint32 channels = 0, nativeRate = 0;
  ma_channel srcMap[MA_MAX_CHANNELS] = {};
  res = ma_decoder_get_data_format(&h.dec, &fmt, &channels, &nativeRate, srcMap, MA_MAX_CHANNELS);
  if (res != MA_SUCCESS) return failure(Reason::Corrupt, path, describe(res));
  if (channels == 0 || nativeRate == 0)
    return failure(Reason::Corrupt, path, "stream reports no channels or sample rate");

  qCDebug(lcDecode) << "opened" << path << "|" << nativeRate << "Hz |" << channels << "ch";

  // 3) Pull everything, chunk by chunk.
  const ma_uint64 chunkFrames = 4096;
  std::vector<float> chunk(size_t(chunkFrames) * channels);
  std::vector<float> interleaved;
  for (;;) {
    ma_uint64 got = 0;
    res = ma_decoder_read_pcm_frames(&h.dec, chunk.data(), chunkFrames, &got);
    if (got > 0) interleaved.insert(interleaved.end(), chunk.begin(), chunk.begin() + got * channels);
    if (res == MA_AT_END || (res == MA_SUCCESS && got == 0)) break;
    if (res != MA_SUCCESS) return failure(Reason::Corrupt, path, describe(res));
  }

  if (interleaved.empty()) return failure(Reason::Empty, path, "stream contains no PCM frames");

  // 4) Optional resample to the analysis rate.
  const int targetRate = _config.analysisSampleRate;   // 0 keeps the native rate
  ma_uint32 rate = nativeRate;
  if (targetRate > 0 && ma_uint32(targetRate) != nativeRate) {
    std::vector<float> resampled;
    QString err;
    if (!resampleInterleaved(interleaved, channels, nativeRate, ma_uint32(targetRate), resampled, err))
      return failure(Reason::Corrupt, path, err);
    interleaved.swap(resampled);
    rate = ma_uint32(targetRate);
    qCDebug(lcDecode) << "resampled" << nativeRate << "->" << rate << "Hz";
  }

  const size_t frames = interleaved.size() / channels;
  if (frames == 0) return failure(Reason::Empty, path, "no frames after resampling");
  if (frames > size_t(INT_MAX)) return failure(Reason::Corrupt, path, "stream too long");

  // 5) De-interleave into standard channel order.
  const std::vector<int> order = standardOrder(srcMap, channels);
  QVector<QVector<float>> planar(int(channels));
  for (ma_uint32 c = 0; c < channels; ++c) {
    QVector<float>& dst = planar[int(c)];
    dst.resize(int(frames));
    const float* src = interleaved.data() + order[c];
    for (size_t i = 0; i < frames; ++i) dst[int(i)] = src[i * channels];
  }

  DecodeResult r;
  r.signal = AudioSignal(std::move(planar), int(rate), int(nativeRate));
  qCDebug(lcDecode) << "decoded" << frames << "frames from" << path;
  return r;
}
