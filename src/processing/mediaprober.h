#ifndef MEDIAPROBER_H
#define MEDIAPROBER_H

#include "assemblytypes.h"

#include <QByteArray>
#include <QJsonObject>
#include <QObject>

class ProcessRunner;

class MediaProber : public QObject
{
    Q_OBJECT
public:
    explicit MediaProber(ProcessRunner *runner, const QString &ffprobePath, QObject *parent = nullptr);

    // Runs ffprobe on the file. Read-only: the file is never touched.
    bool probe(const QString &filePath, MediaProbe &result, AssemblyError *error = nullptr);

    static QStringList probeArguments(const QString &filePath);
    static bool parseProbeJson(const QByteArray &jsonData, MediaProbe &result, QString *problem = nullptr);
    // -90, 90, 180 or 0
    static int streamRotation(const QJsonObject &stream);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);

private:
    ProcessRunner *m_runner;
    QString m_ffprobePath;
};

#endif // MEDIAPROBER_H
