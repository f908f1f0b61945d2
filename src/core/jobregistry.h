#ifndef JOBREGISTRY_H
#define JOBREGISTRY_H

#include <QHash>
#include <QMap>
#include <QReadWriteLock>
#include <QString>

struct JobProgress
{
    QString stage;
    int percent = 0;
    QString message;
};

/**
 * @brief Point-in-time progress of every job, keyed by job id
 *
 * Readers get copies. Each entry is written only through the JobContext of
 * the worker that owns the job.
 */
class JobRegistry
{
public:
    JobRegistry() = default;
    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    void update(const QString &jobId, const JobProgress &progress);
    void remove(const QString &jobId);

    bool snapshot(const QString &jobId, JobProgress &progress) const;
    QMap<QString, JobProgress> snapshotAll() const;
    bool contains(const QString &jobId) const;

private:
    mutable QReadWriteLock m_lock;
    QHash<QString, JobProgress> m_jobs;
};

/**
 * @brief Handle owned by the worker running one job
 */
class JobContext
{
public:
    explicit JobContext(const QString &jobId, JobRegistry *registry = nullptr);

    QString jobId() const { return m_jobId; }
    JobProgress current() const { return m_progress; }

    // Resets percent to 0
    void setStage(const QString &stage, const QString &message = QString());
    void setPercent(int percent);
    void setMessage(const QString &message);

private:
    void publish();

    QString m_jobId;
    JobRegistry *m_registry;
    JobProgress m_progress;
};

#endif // JOBREGISTRY_H
