#include "PlotRenderer.h"
#include "Logging.h"
#include <QDir>
#include <QPainter>
#include <QPen>
#include <algorithm>
#include <cmath>

PlotRenderer::PlotRenderer(const QSize& size) : _size(size) {}

QColor PlotRenderer::levelColor(float t) {
  t = std::clamp(t, 0.0f, 1.0f);
  // hue 240 (blue, quiet) -> 0 (red, loud), darker toward the floor
  const int hue = int(std::round(240.0f * (1.0f - t)));
  return QColor::fromHsv(hue, 220, int(40 + 215 * t));
}

QRect PlotRenderer::plotArea() const {
  // margins for title and axis labels
  return QRect(60, 30, std::max(10, _size.width() - 80), std::max(10, _size.height() - 60));
}

QImage PlotRenderer::blank() const {
  QImage img(_size, QImage::Format_ARGB32_Premultiplied);
  img.fill(QColor(40, 40, 40));
  return img;
}

void PlotRenderer::drawFrame(QPainter& p, const QRect& plot, const QString& title,
                             const QString& xLeft, const QString& xRight,
                             const QString& yTop, const QString& yBottom) const
{
  p.setPen(Qt::white);
  p.drawText(QPoint(plot.left(), 20), title);
  p.setPen(Qt::gray);
  p.drawRect(plot.adjusted(0, 0, -1, -1));

  p.setPen(Qt::lightGray);
  p.drawText(plot.bottomLeft() + QPoint(0, 18), xLeft);
  p.drawText(plot.bottomRight() + QPoint(-60, 18), xRight);
  p.drawText(QPoint(4, plot.top() + 10), yTop);
  p.drawText(QPoint(4, plot.bottom()), yBottom);
}

void PlotRenderer::drawCurve(QPainter& p, const QRect& plot, const QVector<float>& y,
                             float yMin, float yMax, const QColor& color) const
{
  if (y.size() < 2) return;
  if (yMax <= yMin) yMax = yMin + 1.0f;
  p.setPen(QPen(color, 1.5));

  auto toY = [&](float v) {
    const float t = std::clamp((v - yMin) / (yMax - yMin), 0.0f, 1.0f);
    return plot.bottom() - int(std::round(t * (plot.height() - 1)));
  };
  const int n = y.size();
  int prevX = plot.left();
  int prevY = toY(y[0]);
  for (int i = 1; i < n; ++i) {
    const int x = plot.left() + int(std::round(double(i) / (n - 1) * (plot.width() - 1)));
    const int yy = toY(y[i]);
    p.drawLine(prevX, prevY, x, yy);
    prevX = x;
    prevY = yy;
  }
}

QImage PlotRenderer::renderWaveform(const WaveformData& w) const {
  QImage img = blank();
  QPainter p(&img);
  const QRect plot = plotArea();
  drawFrame(p, plot, "Waveform", "0 s", QString("%1 s").arg(w.durationSeconds, 0, 'f', 2), "+1", "-1");

  const int n = w.samples.size();
  if (n == 0) { p.end(); return img; }

  // Min/max per pixel column
  p.setPen(QColor(100, 200, 255));
  const int width = plot.width();
  const int mid = plot.center().y();
  const float half = plot.height() * 0.5f;
  for (int x = 0; x < width; ++x) {
    const int a = int(qint64(x) * n / width);
    const int z = std::max(a + 1, int(qint64(x + 1) * n / width));
    float lo = 1.0f, hi = -1.0f;
    for (int i = a; i < std::min(z, n); ++i) {
      lo = std::min(lo, w.samples[i]);
      hi = std::max(hi, w.samples[i]);
    }
    if (hi < lo) continue;
    const int y0 = mid - int(std::clamp(hi, -1.0f, 1.0f) * half);
    const int y1 = mid - int(std::clamp(lo, -1.0f, 1.0f) * half);
    p.drawLine(plot.left() + x, y0, plot.left() + x, y1);
  }
  p.end();
  return img;
}

QImage PlotRenderer::renderSpectrogram(const SpectrogramData& s, float rangeDb) const {
  QImage img = blank();
  QPainter p(&img);
  const QRect plot = plotArea();
  const double nyquist = s.binHz * std::max(0, s.binCount() - 1);
  drawFrame(p, plot, "Spectrogram (dB)", "0 s", QString("%1 s").arg(s.spanSeconds(), 0, 'f', 2),
            QString("%1 Hz").arg(nyquist, 0, 'f', 0), "0 Hz");

  const int cols = s.columnCount();
  const int bins = s.binCount();
  if (cols == 0 || bins == 0) { p.end(); return img; }

  float peak = 0.0f;
  for (const QVector<float>& c : s.columns)
    for (float m : c) peak = std::max(peak, m);
  const float refDb = 20.0f * std::log10(std::max(peak, 1e-10f));

  // Nearest column/bin per pixel, low frequencies at the bottom
  QImage heat(plot.size(), QImage::Format_RGB32);
  for (int x = 0; x < plot.width(); ++x) {
    const QVector<float>& col = s.columns[std::min(cols - 1, int(qint64(x) * cols / plot.width()))];
    for (int y = 0; y < plot.height(); ++y) {
      const int k = std::min(bins - 1, int(qint64(plot.height() - 1 - y) * bins / plot.height()));
      const float db = 20.0f * std::log10(std::max(col[k], 1e-10f)) - refDb;
      heat.setPixel(x, y, levelColor(1.0f + db / rangeDb).rgb());
    }
  }
  p.drawImage(plot.topLeft(), heat);
  p.end();
  return img;
}

QImage PlotRenderer::renderSpectrum(const SpectrumData& s) const {
  QImage img = blank();
  QPainter p(&img);
  const QRect plot = plotArea();
  const float fMax = s.frequencies.isEmpty() ? 0.0f : s.frequencies.last();
  float mx = 0.0f;
  for (float m : s.magnitudes) mx = std::max(mx, m);
  drawFrame(p, plot, "Frequency Spectrum", "0 Hz", QString("%1 Hz").arg(fMax, 0, 'f', 0),
            QString::number(mx, 'g', 3), "0");
  drawCurve(p, plot, s.magnitudes, 0.0f, mx, QColor(255, 170, 60));
  p.end();
  return img;
}

QImage PlotRenderer::renderEnvelope(const EnvelopeData& e) const {
  QImage img = blank();
  QPainter p(&img);
  const QRect plot = plotArea();
  const float fMax = e.frequencies.isEmpty() ? 0.0f : e.frequencies.last();
  float lo = 0.0f, hi = 0.0f;
  if (!e.levelsDb.isEmpty()) {
    const auto mm = std::minmax_element(e.levelsDb.begin(), e.levelsDb.end());
    lo = *mm.first;
    hi = *mm.second;
  }
  drawFrame(p, plot, QString("Spectral Envelope (%1-bin smoothing)").arg(2 * e.order + 1),
            "0 Hz", QString("%1 Hz").arg(fMax, 0, 'f', 0),
            QString("%1 dB").arg(hi, 0, 'f', 0), QString("%1 dB").arg(lo, 0, 'f', 0));
  drawCurve(p, plot, e.levelsDb, lo, hi, QColor(120, 255, 120));
  p.end();
  return img;
}

QImage PlotRenderer::renderPeakLevel(const QVector<float>& peakDb, double secondsPerColumn) const {
  QImage img = blank();
  QPainter p(&img);
  const QRect plot = plotArea();
  float lo = 0.0f, hi = 0.0f;
  if (!peakDb.isEmpty()) {
    const auto mm = std::minmax_element(peakDb.begin(), peakDb.end());
    lo = *mm.first;
    hi = *mm.second;
  }
  drawFrame(p, plot, "Peak Level per Frame", "0 s",
            QString("%1 s").arg(peakDb.size() * secondsPerColumn, 0, 'f', 2),
            QString("%1 dB").arg(hi, 0, 'f', 0), QString("%1 dB").arg(lo, 0, 'f', 0));
  drawCurve(p, plot, peakDb, lo, hi, QColor(255, 100, 100));
  p.end();
  return img;
}

QStringList PlotRenderer::saveAll(const VisualizationData& v, const QString& dir, QString* error) const {
  QStringList written;
  if (!QDir().mkpath(dir)) {
    if (error) *error = QString("cannot create %1").arg(dir);
    return written;
  }

  const QDir out(dir);
  const std::pair<QString, QImage> plots[] = {
    {"waveform.png",    renderWaveform(v.waveform)},
    {"spectrogram.png", renderSpectrogram(v.spectrogram)},
    {"spectrum.png",    renderSpectrum(v.spectrum)},
    {"envelope.png",    renderEnvelope(v.envelope)},
    {"peak_level.png",  renderPeakLevel(v.peakLevelDb, v.spectrogram.secondsPerColumn)},
  };
  for (const auto& plot : plots) {
    const QString path = out.filePath(plot.first);
    if (!plot.second.save(path, "PNG")) {
      qCWarning(lcCli) << "failed to write" << path;
      if (error) *error = QString("failed to write %1").arg(path);
      return written;
    }
    written << path;
  }
  return written;
}
