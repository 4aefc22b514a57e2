#pragma once
#include <QColor>
#include <QImage>
#include <QSize>
#include <QStringList>
#include "VisualizationBuilder.h"

class QPainter;

// Draws the visualization datasets into images. Needs a QGuiApplication for text.
class PlotRenderer {
public:
  explicit PlotRenderer(const QSize& size = QSize(1000, 400));

  QImage renderWaveform(const WaveformData& w) const;
  QImage renderSpectrogram(const SpectrogramData& s, float rangeDb = 80.0f) const;
  QImage renderSpectrum(const SpectrumData& s) const;
  QImage renderEnvelope(const EnvelopeData& e) const;
  QImage renderPeakLevel(const QVector<float>& peakDb, double secondsPerColumn) const;

  // Writes waveform.png, spectrogram.png, spectrum.png, envelope.png, peak_level.png.
  // Returns the paths written; stops at the first failure and reports it in `error`.
  QStringList saveAll(const VisualizationData& v, const QString& dir, QString* error = nullptr) const;

  // 0..1 -> blue..red
  static QColor levelColor(float t);

private:
  QSize _size;

  QRect plotArea() const;
  QImage blank() const;
  void drawFrame(QPainter& p, const QRect& plot, const QString& title,
                 const QString& xLeft, const QString& xRight,
                 const QString& yTop, const QString& yBottom) const;
  void drawCurve(QPainter& p, const QRect& plot, const QVector<float>& y,
                 float yMin, float yMax, const QColor& color) const;
};
