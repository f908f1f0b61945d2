#ifndef ASSEMBLYORCHESTRATOR_H
#define ASSEMBLYORCHESTRATOR_H

#include "appsettings.h"
#include "assemblytypes.h"
#include "backgroundcompositor.h"

#include <QColor>
#include <QList>
#include <QObject>

class JobContext;
class JobRegistry;
class MediaProber;
class ProcessRunner;

enum class AssemblyStage
{
    Idle,
    ReconcilingTiming,
    PreparingBackground,
    RasterizingCues,
    Compositing,
    Validating,
    Done,
    Failed
};

QString assemblyStageToString(AssemblyStage stage);

/**
 * @brief Everything the pipeline reads from configuration
 */
struct AssemblyConfig
{
    QString ffmpegPath;
    QString ffprobePath;
    EncodingSettings encoding;
    PlatformConstraints platform;
    RasterSettings raster;
    QColor fallbackColor;
    PollSettings avatarPoll;
    RetrySettings probeRetry;

    static AssemblyConfig fromSettings(const AppSettings &settings);
};

struct BatchOutcome
{
    QString jobId;
    bool succeeded = false;
    AssemblyResult result;
    AssemblyError error;
};

/**
 * @brief Runs one request through timing, background, cues, encode, validation
 *
 * Single-threaded and synchronous. A background that cannot be used is
 * replaced by the flat-color track; timing, input and encoding errors end
 * the job. Validation issues never fail a job.
 */
class AssemblyOrchestrator : public QObject
{
    Q_OBJECT
public:
    explicit AssemblyOrchestrator(const AssemblyConfig &config, ProcessRunner *runner, QObject *parent = nullptr);
    ~AssemblyOrchestrator() override;

    bool assemble(const AssemblyRequest &request, AssemblyResult &result, AssemblyError *error = nullptr,
                  JobContext *context = nullptr);

    // Jobs run one after another; a failed job is logged and skipped
    QList<BatchOutcome> runBatch(const QList<AssemblyRequest> &requests, JobRegistry *registry = nullptr);

    AssemblyStage stage() const;

    static QString resultFilePath(const QString &outputPath);
    static bool writeResultFile(const QString &path, const AssemblyRequest &request, const AssemblyResult &result,
                                double actualDuration, double estimatedDuration, AssemblyError *error = nullptr);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);
    void stageChanged(AssemblyStage stage);
    void progressUpdated(int percentage, const QString &stageName = "");
    void jobFinished(const QString &jobId, bool succeeded, const AssemblyResult &result, const AssemblyError &error);

private:
    void setStage(AssemblyStage stage, JobContext *context, const QString &message = QString());
    bool resolveAvatar(const QString &path, MediaProbe &probe, AssemblyError *error);
    bool resolveDurations(const AssemblyRequest &request, const MediaProbe *avatarProbe,
                          double &actualDuration, double &estimatedDuration, AssemblyError *error);
    bool prepareBackground(const AssemblyRequest &request, const MediaProbe *avatarProbe, double targetDuration,
                           BackgroundTrack &track, AssemblyError *error);
    bool failJob(JobContext *context, AssemblyError *error, const AssemblyError &cause);

    AssemblyConfig m_config;
    ProcessRunner *m_runner;
    MediaProber *m_prober;
    BackgroundCompositor *m_backgroundCompositor;
    AssemblyStage m_stage = AssemblyStage::Idle;
};

Q_DECLARE_METATYPE(AssemblyStage)

#endif // ASSEMBLYORCHESTRATOR_H
