#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include "AudioAnalyzer.h"

class ReportFormatter {
public:
  // Plain-text summary: file info, metadata, analysis, tempo, loudness, chroma.
  static QString toText(const AnalysisReport& report);

  // Report as JSON. Visualization arrays are large, so they are opt-in.
  static QJsonObject toJson(const AnalysisReport& report, bool includeVisuals = false);
  static QByteArray toJsonBytes(const AnalysisReport& report, bool includeVisuals = false);

  static QJsonObject visualsToJson(const VisualizationData& v);
};
