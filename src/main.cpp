#include <QCommandLineParser>
#include <QFile>
#include <QGuiApplication>
#include <QThread>
#include <QTextStream>
#include <atomic>
#include <csignal>
#include "AnalysisConfig.h"
#include "AnalysisWorker.h"
#include "Logging.h"
#include "PlotRenderer.h"
#include "ReportFormatter.h"

namespace {
std::atomic<AnalysisWorker*> g_worker{nullptr};

// Ctrl+C: ask the running analysis to stop at the next stage boundary.
void onInterrupt(int) {
  if (AnalysisWorker* w = g_worker.load()) w->requestStop();
}
}

int main(int argc, char* argv[]) {
  // Plots are drawn into images only; no window system needed.
  if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", "offscreen");

  QGuiApplication app(argc, argv);
  QGuiApplication::setApplicationName("audioinspector");
  QGuiApplication::setApplicationVersion("1.0");

  QCommandLineParser parser;
  parser.setApplicationDescription("Inspect an audio file: metadata, acoustic features and plots.");
  parser.addHelpOption();
  parser.addVersionOption();
  parser.addPositionalArgument("file", "Audio file to analyze (wav, flac, mp3, ogg, aiff).");

  const QCommandLineOption configOpt("config", "JSON file with analysis settings.", "file");
  const QCommandLineOption jsonOpt("json", "Print the report as JSON instead of text.");
  const QCommandLineOption exportOpt("export", "Write the report plus visualization arrays as JSON.", "file");
  const QCommandLineOption plotsOpt("plots", "Render PNG plots into this directory.", "dir");
  const QCommandLineOption rateOpt("sample-rate", "Analysis sample rate in Hz (0 = native).", "hz");
  const QCommandLineOption seqOpt("sequential", "Run the spectral transform on the calling thread.");
  const QCommandLineOption weightOpt("loudness", "Loudness weighting: flat or a-weighted.", "mode");
  const QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging.");
  parser.addOptions({configOpt, jsonOpt, exportOpt, plotsOpt, rateOpt, seqOpt, weightOpt, verboseOpt});
  parser.process(app);

  enableVerboseLogging(parser.isSet(verboseOpt));

  QTextStream out(stdout);
  QTextStream err(stderr);

  const QStringList args = parser.positionalArguments();
  if (args.size() != 1) {
    err << "expected exactly one audio file\n";
    parser.showHelp(2);
  }
  const QString path = args.first();

  // --- Config: defaults, then file, then flags ---
  AnalysisConfig config;
  if (parser.isSet(configOpt)) {
    QString msg;
    if (!loadConfig(parser.value(configOpt), config, &msg)) {
      err << "config error: " << msg << "\n";
      return 2;
    }
  }
  if (parser.isSet(rateOpt)) {
    bool ok = false;
    config.analysisSampleRate = parser.value(rateOpt).toInt(&ok);
    if (!ok) { err << "--sample-rate must be an integer\n"; return 2; }
  }
  if (parser.isSet(seqOpt)) config.parallel = false;
  if (parser.isSet(weightOpt) && !parseLoudnessWeighting(parser.value(weightOpt), config.loudnessWeighting)) {
    err << "--loudness must be flat or a-weighted\n";
    return 2;
  }
  const QStringList problems = config.validate();
  if (!problems.isEmpty()) {
    for (const QString& p : problems) err << "config error: " << p << "\n";
    return 2;
  }

  // --- Worker on its own thread ---
  QThread workerThread;
  auto* worker = new AnalysisWorker(config);
  worker->moveToThread(&workerThread);
  g_worker.store(worker);
  std::signal(SIGINT, onInterrupt);

  int exitCode = 0;
  QObject::connect(&workerThread, &QThread::started, worker, [worker, path] { worker->analyzeFile(path); });
  QObject::connect(worker, &AnalysisWorker::status, &app, [](const QString& msg) {
    qCInfo(lcCli).noquote() << msg;
  });
  QObject::connect(worker, &AnalysisWorker::finished, &app, [&](const AnalysisResult& result) {
    g_worker.store(nullptr);
    switch (result.status) {
      case AnalysisResult::Status::DecodeFailed:
        err << "error: " << result.error->message() << "\n";
        exitCode = 1;
        break;
      case AnalysisResult::Status::Cancelled:
        err << "cancelled\n";
        exitCode = 130;
        break;
      case AnalysisResult::Status::Success: {
        const AnalysisReport& report = *result.report;
        if (parser.isSet(jsonOpt)) out << ReportFormatter::toJsonBytes(report, false);
        else out << ReportFormatter::toText(report);
        out.flush();

        if (parser.isSet(exportOpt)) {
          QFile f(parser.value(exportOpt));
          if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate) ||
              f.write(ReportFormatter::toJsonBytes(report, true)) < 0) {
            err << "cannot write " << f.fileName() << ": " << f.errorString() << "\n";
            exitCode = 3;
          }
        }
        if (parser.isSet(plotsOpt)) {
          QString msg;
          const QStringList files = PlotRenderer().saveAll(report.visuals, parser.value(plotsOpt), &msg);
          for (const QString& file : files) qCInfo(lcCli).noquote() << "wrote" << file;
          if (!msg.isEmpty()) { err << msg << "\n"; exitCode = 3; }
        }
        break;
      }
    }
    workerThread.quit();
  });
  QObject::connect(&workerThread, &QThread::finished, &app, &QCoreApplication::quit);
  QObject::connect(&workerThread, &QThread::finished, worker, &QObject::deleteLater);

  workerThread.start();
  app.exec();

  workerThread.wait();
  std::signal(SIGINT, SIG_DFL);
  err.flush();
  return exitCode;
}
