#include "assemblyworker.h"
#include "processmanager.h"

AssemblyWorker::AssemblyWorker(const AssemblyConfig &config, const QList<AssemblyRequest> &requests,
                               JobRegistry *registry, ProcessRunner *runner, QObject *parent)
    : QObject(parent),
    m_config(config),
    m_requests(requests),
    m_registry(registry),
    m_runner(runner)
{}

AssemblyWorker::~AssemblyWorker()
{
}

void AssemblyWorker::start()
{
    if (!m_runner) {
        m_processManager = new ProcessManager(this);
        m_runner = m_processManager;

        connect(m_processManager, &ProcessManager::processOutput, this, [this](const QString &output) {
            emit logMessage(output, LogCategory::DEBUG);
        });
        connect(m_processManager, &ProcessManager::processStdErr, this, [this](const QString &output) {
            emit logMessage(output, LogCategory::FFMPEG);
        });
        connect(m_processManager, &ProcessManager::processError, this, [this](const QString &error) {
            emit logMessage(error, LogCategory::APP);
        });
    }
    m_orchestrator = new AssemblyOrchestrator(m_config, m_runner, this);

    connect(m_orchestrator, &AssemblyOrchestrator::logMessage, this, &AssemblyWorker::logMessage);
    connect(m_orchestrator, &AssemblyOrchestrator::progressUpdated, this, &AssemblyWorker::progressUpdated);
    connect(m_orchestrator, &AssemblyOrchestrator::jobFinished, this, &AssemblyWorker::jobFinished);

    const QList<BatchOutcome> outcomes = m_orchestrator->runBatch(m_requests, m_registry);

    int succeeded = 0;
    for (const BatchOutcome &outcome : outcomes) {
        if (outcome.succeeded) {
            ++succeeded;
        }
    }
    emit finished(succeeded, outcomes.size() - succeeded);
}

int AssemblyWorker::exitCode(int jobCount, int succeededCount)
{
    if (jobCount <= 0 || succeededCount <= 0) {
        return ExitFailure;
    }
    if (jobCount == 1) {
        return succeededCount == 1 ? ExitOk : ExitFailure;
    }
    return ExitOk;
}
