#ifndef ASSEMBLYWORKER_H
#define ASSEMBLYWORKER_H

#include "assemblyorchestrator.h"
#include "assemblytypes.h"

#include <QList>
#include <QObject>

class JobRegistry;
class ProcessManager;
class ProcessRunner;

enum ExitCode
{
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

/**
 * @brief Runs requests off the caller's thread
 *
 * Meant to be moved to a QThread and started from QThread::started. Owns its
 * own ProcessManager and orchestrator, both created in start() so they live
 * in the worker thread. Progress goes to the shared JobRegistry.
 */
class AssemblyWorker : public QObject
{
    Q_OBJECT
public:
    // Without a runner, start() creates a ProcessManager in the worker thread
    explicit AssemblyWorker(const AssemblyConfig &config, const QList<AssemblyRequest> &requests,
                            JobRegistry *registry, ProcessRunner *runner = nullptr, QObject *parent = nullptr);
    ~AssemblyWorker() override;

    /**
     * @brief Process exit code for a run of @p jobCount jobs
     *
     * A single job fails the run when it fails. A batch fails only when no
     * job produced a video. Validation issues never count as failures.
     */
    static int exitCode(int jobCount, int succeededCount);

public slots:
    void start();

signals:
    void logMessage(const QString &message, LogCategory category);
    void progressUpdated(int percentage, const QString &stageName = "");
    void jobFinished(const QString &jobId, bool succeeded, const AssemblyResult &result, const AssemblyError &error);
    void finished(int succeededCount, int failedCount);

private:
    AssemblyConfig m_config;
    QList<AssemblyRequest> m_requests;
    JobRegistry *m_registry;
    ProcessRunner *m_runner;
    ProcessManager *m_processManager = nullptr;
    AssemblyOrchestrator *m_orchestrator = nullptr;
};

#endif // ASSEMBLYWORKER_H
