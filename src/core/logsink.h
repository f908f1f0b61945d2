#ifndef LOGSINK_H
#define LOGSINK_H

#include "assemblytypes.h"

#include <QFile>
#include <QMutex>
#include <QObject>
#include <QSet>

/**
 * @brief Receives logMessage signals from every component
 *
 * All messages go to the log file; only enabled categories are echoed to stderr.
 * Safe to call from worker threads.
 */
class LogSink : public QObject
{
    Q_OBJECT
public:
    explicit LogSink(const QString &logFilePath, const QSet<LogCategory> &enabledCategories,
                     QObject *parent = nullptr);
    ~LogSink() override;

    bool isFileOpen() const;

    static QString formatLine(const QString &message, LogCategory category);

public slots:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);

private:
    QFile m_logFile;
    QSet<LogCategory> m_enabledCategories;
    QMutex m_mutex;
};

#endif // LOGSINK_H
