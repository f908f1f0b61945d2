#include "jobregistry.h"

#include <QReadLocker>
#include <QWriteLocker>

void JobRegistry::update(const QString &jobId, const JobProgress &progress)
{
    QWriteLocker locker(&m_lock);
    m_jobs.insert(jobId, progress);
}

void JobRegistry::remove(const QString &jobId)
{
    QWriteLocker locker(&m_lock);
    m_jobs.remove(jobId);
}

bool JobRegistry::snapshot(const QString &jobId, JobProgress &progress) const
{
    QReadLocker locker(&m_lock);
    auto it = m_jobs.constFind(jobId);
    if (it == m_jobs.constEnd()) {
        return false;
    }
    progress = it.value();
    return true;
}

QMap<QString, JobProgress> JobRegistry::snapshotAll() const
{
    QReadLocker locker(&m_lock);
    QMap<QString, JobProgress> copy;
    for (auto it = m_jobs.constBegin(); it != m_jobs.constEnd(); ++it) {
        copy.insert(it.key(), it.value());
    }
    return copy;
}

bool JobRegistry::contains(const QString &jobId) const
{
    QReadLocker locker(&m_lock);
    return m_jobs.contains(jobId);
}

JobContext::JobContext(const QString &jobId, JobRegistry *registry)
    : m_jobId(jobId),
    m_registry(registry)
{
    m_progress.stage = "Idle";
    publish();
}

void JobContext::setStage(const QString &stage, const QString &message)
{
    m_progress.stage = stage;
    m_progress.percent = 0;
    m_progress.message = message;
    publish();
}

void JobContext::setPercent(int percent)
{
    m_progress.percent = qBound(0, percent, 100);
    publish();
}

void JobContext::setMessage(const QString &message)
{
    m_progress.message = message;
    publish();
}

void JobContext::publish()
{
    if (m_registry) {
        m_registry->update(m_jobId, m_progress);
    }
}
