#include "Logging.h"

Q_LOGGING_CATEGORY(lcDecode,   "audioinspector.decode",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcDsp,      "audioinspector.dsp",      QtInfoMsg)
Q_LOGGING_CATEGORY(lcFeatures, "audioinspector.features", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPipeline, "audioinspector.pipeline", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTags,     "audioinspector.tags",     QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli,      "audioinspector.cli",      QtInfoMsg)

void enableVerboseLogging(bool on) {
  QLoggingCategory::setFilterRules(on ? QStringLiteral("audioinspector.*.debug=true")
                                      : QStringLiteral("audioinspector.*.debug=false"));
}
