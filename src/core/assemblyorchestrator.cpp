#include "assemblyorchestrator.h"
#include "jobregistry.h"
#include "mediaprober.h"
#include "outputvalidator.h"
#include "processrunner.h"
#include "retrypolicy.h"
#include "subtitlerasterizer.h"
#include "timelinecompositor.h"
#include "timingreconciler.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QScopedPointer>
#include <QTemporaryDir>

QString assemblyStageToString(AssemblyStage stage)
{
    switch (stage) {
    case AssemblyStage::Idle: return "Idle";
    case AssemblyStage::ReconcilingTiming: return "ReconcilingTiming";
    case AssemblyStage::PreparingBackground: return "PreparingBackground";
    case AssemblyStage::RasterizingCues: return "RasterizingCues";
    case AssemblyStage::Compositing: return "Compositing";
    case AssemblyStage::Validating: return "Validating";
    case AssemblyStage::Done: return "Done";
    case AssemblyStage::Failed: return "Failed";
    }
    return "Unknown";
}

AssemblyConfig AssemblyConfig::fromSettings(const AppSettings &settings)
{
    AssemblyConfig config;
    config.ffmpegPath = settings.ffmpegPath();
    config.ffprobePath = settings.ffprobePath();
    config.encoding = settings.encoding();
    config.platform = settings.platform();
    config.raster = settings.raster();
    config.fallbackColor = settings.fallbackColor();
    config.avatarPoll = settings.avatarPoll();
    config.probeRetry = settings.probeRetry();
    return config;
}

AssemblyOrchestrator::AssemblyOrchestrator(const AssemblyConfig &config, ProcessRunner *runner, QObject *parent)
    : QObject(parent),
    m_config(config),
    m_runner(runner)
{
    m_prober = new MediaProber(m_runner, m_config.ffprobePath, this);
    m_backgroundCompositor = new BackgroundCompositor(m_prober, m_config.encoding, m_config.fallbackColor, this);

    connect(m_prober, &MediaProber::logMessage, this, &AssemblyOrchestrator::logMessage);
    connect(m_backgroundCompositor, &BackgroundCompositor::logMessage, this, &AssemblyOrchestrator::logMessage);
}

AssemblyOrchestrator::~AssemblyOrchestrator()
{
}

AssemblyStage AssemblyOrchestrator::stage() const
{
    return m_stage;
}

void AssemblyOrchestrator::setStage(AssemblyStage stage, JobContext *context, const QString &message)
{
    m_stage = stage;
    const QString name = assemblyStageToString(stage);
    if (context) {
        context->setStage(name, message);
        if (stage == AssemblyStage::Done) {
            context->setPercent(100);
        }
    }
    emit stageChanged(stage);
    emit progressUpdated(stage == AssemblyStage::Done ? 100 : 0, name);
    emit logMessage("Stage: " + name, LogCategory::DEBUG);
}

bool AssemblyOrchestrator::failJob(JobContext *context, AssemblyError *error, const AssemblyError &cause)
{
    emit logMessage(QString("Job failed [%1]: %2").arg(AssemblyError::kindName(cause.kind), cause.message),
                    LogCategory::APP);
    if (!cause.diagnostics.isEmpty()) {
        emit logMessage(cause.diagnostics, LogCategory::FFMPEG);
    }
    setStage(AssemblyStage::Failed, context, cause.message);
    if (error) {
        *error = cause;
    }
    return false;
}

bool AssemblyOrchestrator::resolveAvatar(const QString &path, MediaProbe &probe, AssemblyError *error)
{
    const QString fileName = QFileInfo(path).fileName();

    if (!QFileInfo::exists(path)) {
        if (m_config.avatarPoll.timeoutMs <= 0) {
            return fail(error, AssemblyError::Kind::BackgroundUnavailable, "Avatar clip not found: " + path);
        }
        emit logMessage(QString("Waiting for avatar clip %1 (every %2 ms, up to %3 ms)")
                            .arg(fileName)
                            .arg(m_config.avatarPoll.intervalMs)
                            .arg(m_config.avatarPoll.timeoutMs),
                        LogCategory::APP);
        if (!pollUntil([path]() { return QFileInfo::exists(path); },
                       m_config.avatarPoll.intervalMs, m_config.avatarPoll.timeoutMs,
                       "avatar clip " + fileName, error)) {
            return false;
        }
    }

    RetryPolicy policy;
    policy.maxAttempts = m_config.probeRetry.maxAttempts;
    policy.initialDelayMs = m_config.probeRetry.initialDelayMs;
    policy.backoffFactor = m_config.probeRetry.backoffFactor;
    policy.isRetryable = [](const AssemblyError &e) { return e.kind == AssemblyError::Kind::ProbeFailed; };
    policy.onRetry = [this](int attempt, const AssemblyError &e, int delayMs) {
        emit logMessage(QString("Probe attempt %1 failed (%2), retrying in %3 ms")
                            .arg(attempt).arg(e.message).arg(delayMs),
                        LogCategory::APP);
    };

    AssemblyError probeError;
    int attempts = 0;
    const bool probed = withRetry(policy, [this, &path, &probe](AssemblyError *e) {
        return m_prober->probe(path, probe, e);
    }, &probeError, &attempts);

    if (!probed) {
        return fail(error, AssemblyError::Kind::BackgroundUnavailable,
                    QString("Avatar clip unreadable after %1 attempt(s): %2").arg(attempts).arg(probeError.message),
                    probeError.diagnostics);
    }
    return true;
}

bool AssemblyOrchestrator::resolveDurations(const AssemblyRequest &request, const MediaProbe *avatarProbe,
                                            double &actualDuration, double &estimatedDuration, AssemblyError *error)
{
    if (avatarProbe) {
        // The avatar clip carries the narration, its length is the real one
        actualDuration = avatarProbe->durationSeconds;
    } else if (request.audioDuration > 0.0) {
        actualDuration = request.audioDuration;
    } else {
        MediaProbe audioProbe;
        AssemblyError probeError;
        if (!m_prober->probe(request.audioPath, audioProbe, &probeError)) {
            return fail(error, AssemblyError::Kind::ProbeFailed,
                        "Cannot determine narration duration: " + probeError.message, probeError.diagnostics);
        }
        actualDuration = audioProbe.durationSeconds;
        emit logMessage(QString("Narration duration probed: %1 s").arg(actualDuration, 0, 'f', 3), LogCategory::TIMING);
    }

    if (actualDuration <= 0.0) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Narration duration is %1 s").arg(actualDuration));
    }

    // 0 means "not stated": the cues were timed against their own last end
    estimatedDuration = request.estimatedDuration;
    if (qFuzzyIsNull(estimatedDuration)) {
        estimatedDuration = TimingReconciler::lastCueEnd(request.cues);
        emit logMessage(QString("Estimated duration not given, using last cue end: %1 s")
                            .arg(estimatedDuration, 0, 'f', 3),
                        LogCategory::TIMING);
    }
    return true;
}

bool AssemblyOrchestrator::prepareBackground(const AssemblyRequest &request, const MediaProbe *avatarProbe,
                                             double targetDuration, BackgroundTrack &track, AssemblyError *error)
{
    const BackgroundSource &source = request.background;
    AssemblyError backgroundError;

    switch (source.kind) {
    case BackgroundSource::Kind::None:
    case BackgroundSource::Kind::Color:
        return m_backgroundCompositor->prepare(source, targetDuration, track, error);
    case BackgroundSource::Kind::Visual:
        if (m_backgroundCompositor->prepare(source, targetDuration, track, &backgroundError)) {
            return true;
        }
        break;
    case BackgroundSource::Kind::AvatarClip:
        if (!avatarProbe) {
            fail(&backgroundError, AssemblyError::Kind::BackgroundUnavailable, "Avatar clip is not usable");
        } else if (m_backgroundCompositor->prepareFromProbe(source, *avatarProbe, targetDuration, track,
                                                            &backgroundError)) {
            return true;
        }
        break;
    }

    if (backgroundError.kind != AssemblyError::Kind::BackgroundUnavailable) {
        if (error) {
            *error = backgroundError;
        }
        return false;
    }

    emit logMessage("Background unavailable, using flat color: " + backgroundError.message, LogCategory::APP);
    track = m_backgroundCompositor->flatColor(m_config.fallbackColor, targetDuration);
    return true;
}

bool AssemblyOrchestrator::assemble(const AssemblyRequest &request, AssemblyResult &result, AssemblyError *error,
                                    JobContext *context)
{
    JobContext localContext(request.jobId);
    if (!context) {
        context = &localContext;
    }

    emit logMessage(QString("Job %1: assembling %2")
                        .arg(request.jobId.isEmpty() ? QString("-") : request.jobId)
                        .arg(QFileInfo(request.outputPath).fileName()),
                    LogCategory::APP);

    AssemblyError stageError;
    setStage(AssemblyStage::ReconcilingTiming, context);

    if (request.outputPath.isEmpty()) {
        fail(&stageError, AssemblyError::Kind::InvalidInput, "No output path given");
        return failJob(context, error, stageError);
    }

    // The avatar clip decides the narration length, so it is resolved first
    MediaProbe avatarProbe;
    bool avatarUsable = false;
    if (request.background.kind == BackgroundSource::Kind::AvatarClip) {
        AssemblyError avatarError;
        avatarUsable = resolveAvatar(request.background.path, avatarProbe, &avatarError);
        if (!avatarUsable) {
            if (avatarError.kind != AssemblyError::Kind::BackgroundUnavailable) {
                return failJob(context, error, avatarError);
            }
            emit logMessage(avatarError.message, LogCategory::APP);
        }
    }
    const MediaProbe *avatar = avatarUsable ? &avatarProbe : nullptr;

    double actualDuration = 0.0;
    double estimatedDuration = 0.0;
    if (!resolveDurations(request, avatar, actualDuration, estimatedDuration, &stageError)) {
        return failJob(context, error, stageError);
    }

    QList<SubtitleCue> cues;
    if (!request.cues.isEmpty()) {
        TimingReconciler reconciler;
        connect(&reconciler, &TimingReconciler::logMessage, this, &AssemblyOrchestrator::logMessage);
        if (!reconciler.reconcile(request.cues, estimatedDuration, actualDuration, cues, &stageError)) {
            return failJob(context, error, stageError);
        }
    } else {
        emit logMessage("Job has no cues, no subtitles will be drawn", LogCategory::APP);
    }

    setStage(AssemblyStage::PreparingBackground, context);
    BackgroundTrack track;
    if (!prepareBackground(request, avatar, actualDuration, track, &stageError)) {
        return failJob(context, error, stageError);
    }
    context->setMessage("Background: " + backgroundStrategyToString(track.strategy));

    setStage(AssemblyStage::RasterizingCues, context);
    // Scratch directory only when the request does not name one
    QScopedPointer<QTemporaryDir> tempDir;
    QString workDir = request.workDir;
    if (workDir.isEmpty()) {
        tempDir.reset(new QTemporaryDir());
        if (!tempDir->isValid()) {
            fail(&stageError, AssemblyError::Kind::InvalidInput, "Cannot create a temporary directory: " + tempDir->errorString());
            return failJob(context, error, stageError);
        }
        workDir = tempDir->path();
    } else if (!QDir().mkpath(workDir)) {
        fail(&stageError, AssemblyError::Kind::InvalidInput, "Cannot create work directory: " + workDir);
        return failJob(context, error, stageError);
    }

    SubtitleRasterizer rasterizer(request.style, m_config.raster);
    connect(&rasterizer, &SubtitleRasterizer::logMessage, this, &AssemblyOrchestrator::logMessage);

    QList<RasterizedCue> layers;
    for (int i = 0; i < cues.size(); ++i) {
        const SubtitleCue &cue = cues.at(i);
        if (cue.text.trimmed().isEmpty()) {
            emit logMessage(QString("Cue %1 is empty, skipped").arg(i + 1), LogCategory::DEBUG);
            continue;
        }
        if (cue.start >= track.duration) {
            emit logMessage(QString("Cue %1 starts after the end of the video, skipped").arg(i + 1), LogCategory::TIMING);
            continue;
        }

        RasterizedCue layer;
        if (!rasterizer.rasterize(cue, i + 1, m_config.encoding.width, m_config.encoding.height, workDir, layer,
                                  &stageError)) {
            return failJob(context, error, stageError);
        }
        layers.append(layer);
        context->setPercent(((i + 1) * 100) / cues.size());
    }
    emit logMessage(QString("%1 subtitle bitmaps ready").arg(layers.size()), LogCategory::APP);

    setStage(AssemblyStage::Compositing, context);
    TimelineCompositor compositor(m_runner, m_config.ffmpegPath, m_config.encoding);
    connect(&compositor, &TimelineCompositor::logMessage, this, &AssemblyOrchestrator::logMessage);
    connect(&compositor, &TimelineCompositor::progressChanged, this, [this, context](int percent) {
        context->setPercent(percent);
        emit progressUpdated(percent, assemblyStageToString(AssemblyStage::Compositing));
    });
    if (!compositor.compose(track, request.audioPath, layers, request.outputPath, &stageError)) {
        return failJob(context, error, stageError);
    }

    setStage(AssemblyStage::Validating, context);
    OutputValidator validator(m_prober, m_config.platform);
    connect(&validator, &OutputValidator::logMessage, this, &AssemblyOrchestrator::logMessage);
    MediaProbe outputProbe;

    AssemblyResult assembled;
    assembled.outputPath = request.outputPath;
    assembled.validation = validator.validateFile(request.outputPath, &outputProbe);
    assembled.strategy = track.strategy;
    assembled.outputDuration = outputProbe.durationSeconds > 0.0 ? outputProbe.durationSeconds : track.duration;

    AssemblyError metadataError;
    if (!writeResultFile(resultFilePath(request.outputPath), request, assembled, actualDuration, estimatedDuration,
                         &metadataError)) {
        emit logMessage(metadataError.message, LogCategory::APP);
    }

    result = assembled;
    setStage(AssemblyStage::Done, context,
             assembled.validation.passed ? QString("OK")
                                         : QString("%1 validation issue(s)").arg(assembled.validation.issues.size()));
    emit logMessage(QString("Job %1 done: %2").arg(request.jobId, request.outputPath), LogCategory::APP);
    return true;
}

QList<BatchOutcome> AssemblyOrchestrator::runBatch(const QList<AssemblyRequest> &requests, JobRegistry *registry)
{
    QList<BatchOutcome> outcomes;
    int succeeded = 0;

    for (int i = 0; i < requests.size(); ++i) {
        const AssemblyRequest &request = requests.at(i);
        BatchOutcome outcome;
        outcome.jobId = request.jobId.isEmpty() ? QString("job_%1").arg(i + 1) : request.jobId;

        emit logMessage(QString("Batch %1/%2: %3").arg(i + 1).arg(requests.size()).arg(outcome.jobId),
                        LogCategory::APP);

        JobContext context(outcome.jobId, registry);
        outcome.succeeded = assemble(request, outcome.result, &outcome.error, &context);
        if (outcome.succeeded) {
            ++succeeded;
        } else {
            emit logMessage(QString("Job %1 failed, continuing with the next one").arg(outcome.jobId), LogCategory::APP);
        }
        outcomes.append(outcome);
        emit jobFinished(outcome.jobId, outcome.succeeded, outcome.result, outcome.error);
    }

    emit logMessage(QString("Batch finished: %1 of %2 job(s) succeeded").arg(succeeded).arg(requests.size()),
                    LogCategory::APP);
    return outcomes;
}

QString AssemblyOrchestrator::resultFilePath(const QString &outputPath)
{
    return QFileInfo(outputPath).absoluteDir().filePath("result.json");
}

bool AssemblyOrchestrator::writeResultFile(const QString &path, const AssemblyRequest &request,
                                           const AssemblyResult &result, double actualDuration, double estimatedDuration,
                                           AssemblyError *error)
{
    QJsonObject validation;
    validation["passed"] = result.validation.passed;
    validation["issues"] = QJsonArray::fromStringList(result.validation.issues);

    QJsonObject root;
    root["jobId"] = request.jobId;
    root["output"] = result.outputPath;
    root["strategy"] = backgroundStrategyToString(result.strategy);
    root["audioDuration"] = actualDuration;
    root["estimatedDuration"] = estimatedDuration;
    root["outputDuration"] = result.outputDuration;
    root["cueCount"] = request.cues.size();
    QJsonObject style;
    request.style.write(style);
    root["style"] = style;
    root["validation"] = validation;
    root["createdAt"] = QDateTime::currentDateTime().toString(Qt::ISODate);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Cannot write %1: %2").arg(path, file.errorString()));
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Failed while writing %1: %2").arg(path, file.errorString()));
    }
    file.close();
    return true;
}
