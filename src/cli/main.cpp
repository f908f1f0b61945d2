#include "appsettings.h"
#include "assemblyworker.h"
#include "jobloader.h"
#include "jobregistry.h"
#include "logsink.h"
#include "mediaprober.h"
#include "outputvalidator.h"
#include "processmanager.h"
#include "srtcodec.h"
#include "timingreconciler.h"

#include <QCommandLineParser>
#include <QGuiApplication>
#include <QTextStream>
#include <QThread>

namespace
{

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

int runJobs(const QStringList& jobDirs, LogSink& sink)
{
    const AppSettings& settings = AppSettings::instance();
    JobLoader loader(settings.defaultStyle(), settings.themeColors(), settings.fallbackColor());
    QObject::connect(&loader, &JobLoader::logMessage, &sink, &LogSink::logMessage);

    QList<AssemblyRequest> requests;
    int loadFailures = 0;
    for (const QString& jobDir : jobDirs)
    {
        AssemblyRequest request;
        AssemblyError error;
        if (!loader.load(jobDir, request, &error))
        {
            sink.logMessage(QString("Skipping %1: %2").arg(jobDir, error.message), LogCategory::APP);
            ++loadFailures;
            continue;
        }
        requests.append(request);
    }

    if (requests.isEmpty())
    {
        return ExitFailure;
    }

    JobRegistry registry;
    int succeeded = 0;

    QThread* thread = new QThread();
    AssemblyWorker* worker = new AssemblyWorker(AssemblyConfig::fromSettings(settings), requests, &registry);
    worker->moveToThread(thread);

    QObject::connect(thread, &QThread::started, worker, &AssemblyWorker::start);
    QObject::connect(worker, &AssemblyWorker::logMessage, &sink, &LogSink::logMessage);
    QObject::connect(worker, &AssemblyWorker::jobFinished, qApp,
                     [](const QString& jobId, bool ok, const AssemblyResult& result, const AssemblyError& error)
                     {
                         if (!ok)
                         {
                             out() << jobId << ": FAILED [" << AssemblyError::kindName(error.kind) << "] "
                                   << error.message << Qt::endl;
                             return;
                         }
                         out() << jobId << ": " << result.outputPath << " ("
                               << backgroundStrategyToString(result.strategy) << ", "
                               << QString::number(result.outputDuration, 'f', 2) << " s)" << Qt::endl;
                         for (const QString& issue : result.validation.issues)
                         {
                             out() << "  issue: " << issue << Qt::endl;
                         }
                     });
    QObject::connect(worker, &AssemblyWorker::finished, qApp,
                     [&succeeded, thread](int succeededCount, int)
                     {
                         succeeded = succeededCount;
                         thread->quit();
                     });
    QObject::connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    QObject::connect(thread, &QThread::finished, qApp, &QCoreApplication::quit);

    thread->start();
    QCoreApplication::exec();
    thread->wait();
    delete thread;

    if (loadFailures > 0)
    {
        sink.logMessage(QString("%1 job(s) could not be loaded").arg(loadFailures), LogCategory::APP);
    }
    return AssemblyWorker::exitCode(jobDirs.size(), succeeded);
}

int runValidate(const QString& filePath, LogSink& sink)
{
    const AppSettings& settings = AppSettings::instance();
    ProcessManager processManager;
    QObject::connect(&processManager, &ProcessManager::processError, &sink,
                     [&sink](const QString& message) { sink.logMessage(message, LogCategory::APP); });
    MediaProber prober(&processManager, settings.ffprobePath());
    QObject::connect(&prober, &MediaProber::logMessage, &sink, &LogSink::logMessage);

    MediaProbe probe;
    AssemblyError error;
    if (!prober.probe(filePath, probe, &error))
    {
        out() << "Cannot probe " << filePath << ": " << error.message << Qt::endl;
        return ExitFailure;
    }

    const ValidationReport report = OutputValidator::validate(probe, settings.platform());
    out() << filePath << ": " << probe.width << "x" << probe.height << ", "
          << QString::number(probe.durationSeconds, 'f', 2) << " s, " << probe.sizeBytes << " bytes" << Qt::endl;
    out() << (report.passed ? "PASSED" : "FAILED") << Qt::endl;
    for (const QString& issue : report.issues)
    {
        out() << "  issue: " << issue << Qt::endl;
    }
    return ExitOk;
}

int runReconcile(const QStringList& args, LogSink& sink)
{
    bool estimatedOk = false;
    bool actualOk = false;
    const double estimated = args.at(1).toDouble(&estimatedOk);
    const double actual = args.at(2).toDouble(&actualOk);
    if (!estimatedOk || !actualOk)
    {
        out() << "Durations must be numbers in seconds" << Qt::endl;
        return ExitUsage;
    }

    QList<SubtitleCue> cues;
    AssemblyError error;
    if (!SrtCodec::readFile(args.at(0), cues, &error))
    {
        out() << error.message << Qt::endl;
        return ExitFailure;
    }

    TimingReconciler reconciler;
    QObject::connect(&reconciler, &TimingReconciler::logMessage, &sink, &LogSink::logMessage);
    QList<SubtitleCue> reconciled;
    if (!reconciler.reconcile(cues, estimated, actual, reconciled, &error) ||
        !SrtCodec::writeFile(args.at(3), reconciled, &error))
    {
        out() << "[" << AssemblyError::kindName(error.kind) << "] " << error.message << Qt::endl;
        return ExitFailure;
    }

    out() << reconciled.size() << " cues written to " << args.at(3) << Qt::endl;
    return ExitOk;
}

} // namespace

int main(int argc, char* argv[])
{
    // Rasterization needs a Gui application, not a display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
    {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("clipassembler");
    QCoreApplication::setApplicationVersion("1.0.0");

    qRegisterMetaType<AssemblyResult>();
    qRegisterMetaType<AssemblyError>();
    qRegisterMetaType<LogCategory>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Assembles narrated short vertical videos from a job directory.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "Settings file (INI).", "file");
    QCommandLineOption logFileOption("log-file", "Log file path.", "path");
    QCommandLineOption verboseOption("verbose", "Echo every log category to stderr.");
    parser.addOption(configOption);
    parser.addOption(logFileOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("command",
                                 "assemble <jobDir> | batch <jobDir>... | validate <file> | "
                                 "reconcile <in.srt> <estimated> <actual> <out.srt>");
    parser.process(app);

    AppSettings& settings = AppSettings::instance();
    settings.load(parser.value(configOption));
    if (parser.isSet(logFileOption))
    {
        settings.setLogFilePath(parser.value(logFileOption));
    }
    QSet<LogCategory> categories = settings.enabledLogCategories();
    if (parser.isSet(verboseOption))
    {
        categories = {LogCategory::APP, LogCategory::FFMPEG, LogCategory::TIMING, LogCategory::DEBUG};
    }
    LogSink sink(settings.logFilePath(), categories);

    QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.takeFirst();

    if (command == "assemble" && positional.size() == 1)
    {
        return runJobs(positional, sink);
    }
    if (command == "batch" && !positional.isEmpty())
    {
        return runJobs(positional, sink);
    }
    if (command == "validate" && positional.size() == 1)
    {
        return runValidate(positional.first(), sink);
    }
    if (command == "reconcile" && positional.size() == 4)
    {
        return runReconcile(positional, sink);
    }

    QTextStream(stderr) << parser.helpText();
    return ExitUsage;
}
