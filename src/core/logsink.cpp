#include "logsink.h"

#include <QDateTime>
#include <QMutexLocker>

#include <cstdio>

LogSink::LogSink(const QString& logFilePath, const QSet<LogCategory>& enabledCategories, QObject* parent)
    : QObject(parent), m_enabledCategories(enabledCategories)
{
    if (!logFilePath.isEmpty())
    {
        m_logFile.setFileName(logFilePath);
        if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        {
            qWarning("Failed to open %s for writing", qPrintable(logFilePath));
        }
    }
}

LogSink::~LogSink()
{
    if (m_logFile.isOpen())
    {
        m_logFile.close();
    }
}

bool LogSink::isFileOpen() const
{
    return m_logFile.isOpen();
}

QString LogSink::formatLine(const QString& message, LogCategory category)
{
    return QString("[%1] %2 - %3")
        .arg(logCategoryToString(category))
        .arg(QDateTime::currentDateTime().toString("hh:mm:ss"))
        .arg(message.trimmed());
}

void LogSink::logMessage(const QString& message, LogCategory category)
{
    if (message.trimmed().isEmpty())
    {
        return;
    }
    const QString timedMessage = formatLine(message, category);

    QMutexLocker locker(&m_mutex);

    // Always write to log file (all categories)
    if (m_logFile.isOpen())
    {
        m_logFile.write(timedMessage.toUtf8());
        m_logFile.write("\n");
        m_logFile.flush();
    }

    // Filter for console display
    if (!m_enabledCategories.contains(category))
    {
        return;
    }

    std::fputs(timedMessage.toLocal8Bit().constData(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}
